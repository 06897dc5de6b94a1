#pragma once
/**
 * @file test_patterns.h
 * @brief Standard test fixtures for the hublink test suite.
 *
 * ## Pattern 1: PureApiTest
 *
 * In-process, no files, no threads of its own.
 * For: pure functions, value types, decoders.
 *
 *   class MyTest : public hublink::tests::PureApiTest { ... };
 *   TEST_F(MyTest, SomeFunction) { EXPECT_EQ(add(1,2), 3); }
 *
 * ## Pattern 2: TempDirTest
 *
 * Gives each test a fresh scratch directory, removed in TearDown().
 * For: file sinks, the JSON file store, configuration files.
 *
 *   class StoreTest : public hublink::tests::TempDirTest { ... };
 *   TEST_F(StoreTest, Persists) { JsonFileStore store(path("store.json")); ... }
 *
 * The Logger is a process-wide singleton started lazily; `test_entrypoint.cpp`
 * shuts it down after all tests have run, so tests must not call
 * `Logger::shutdown()` themselves.
 */
#include "shared_test_helpers.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

namespace hublink::tests
{

// ============================================================================
// Pattern 1: Pure API / Function Tests
// ============================================================================

class PureApiTest : public ::testing::Test
{
  protected:
    void SetUp() override {}
    void TearDown() override {}
};

// ============================================================================
// Pattern 2: Tests with a scratch directory
// ============================================================================

class TempDirTest : public ::testing::Test
{
  protected:
    void SetUp() override { m_dir = helper::make_unique_temp_dir("hublink-test"); }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(m_dir, ec);
    }

    [[nodiscard]] const std::filesystem::path &dir() const noexcept { return m_dir; }
    [[nodiscard]] std::filesystem::path path(const std::string &name) const { return m_dir / name; }

  private:
    std::filesystem::path m_dir;
};

} // namespace hublink::tests

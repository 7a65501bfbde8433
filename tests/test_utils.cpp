// cppcheck-suppress-file missingIncludeSystem
// cppcheck-suppress-file missingInclude
// cppcheck-suppress-file syntaxError
#include <gtest/gtest.h>

#include <string>

#include "file_lock.hpp"
#include "sha256.hpp"
#include "test_support.hpp"
#include "utils.hpp"

namespace hookguard {
namespace {

using testing_support::TempDir;

TEST(Sha256Test, KnownVectors)
{
    EXPECT_EQ(Sha256::hash_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(Sha256::hash_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(Sha256::hash_hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(Sha256Test, IncrementalUpdateMatchesOneShot)
{
    const std::string data(1000, 'a');
    Sha256 h;
    h.update(data.substr(0, 63));
    h.update(data.substr(63, 1));
    h.update(data.substr(64));
    auto digest = h.finish();
    EXPECT_EQ(to_hex(digest.data(), digest.size()), Sha256::hash_hex(data));
}

TEST(UtilsTest, ParseIntegers)
{
    uint64_t u = 0;
    EXPECT_TRUE(parse_uint64("4096", u));
    EXPECT_EQ(u, 4096u);
    EXPECT_FALSE(parse_uint64("", u));
    EXPECT_FALSE(parse_uint64("12ab", u));
    EXPECT_FALSE(parse_uint64("-1", u));

    int64_t i = 0;
    EXPECT_TRUE(parse_int64("-30", i));
    EXPECT_EQ(i, -30);
}

TEST(UtilsTest, ParseKeyValueTrims)
{
    std::string key;
    std::string value;
    ASSERT_TRUE(parse_key_value("  project_root = /srv/x  ", key, value));
    EXPECT_EQ(key, "project_root");
    EXPECT_EQ(value, "/srv/x");
    EXPECT_FALSE(parse_key_value("no separator", key, value));
}

TEST(UtilsTest, JsonEscapeControlCharacters)
{
    EXPECT_EQ(json_escape("a\"b\\c\n\t"), "a\\\"b\\\\c\\n\\t");
    EXPECT_EQ(json_escape(std::string("\x01", 1)), "\\u0001");
}

TEST(UtilsTest, AtomicWriteAndRead)
{
    TempDir dir("hookguard_utils_test");
    const std::string path = dir.file("nested/state.txt");
    ASSERT_TRUE(ensure_parent_directory(path));
    ASSERT_TRUE(atomic_write_file(path, "first"));
    ASSERT_TRUE(atomic_write_file(path, "second"));
    auto content = read_file_to_string(path);
    ASSERT_TRUE(content);
    EXPECT_EQ(*content, "second");

    auto missing = read_file_to_string(dir.file("absent.txt"));
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code(), ErrorCode::ResourceNotFound);
}

TEST(FileLockTest, SecondAcquireTimesOutWhileHeld)
{
    TempDir dir("hookguard_lock_test");
    const std::string lock_path = lock_path_for(dir.file("overrides.jsonl"));
    EXPECT_EQ(lock_path, dir.file("overrides.jsonl.lock"));

    auto first = ScopedFileLock::acquire(lock_path, 100);
    ASSERT_TRUE(first);
    EXPECT_TRUE(first->ok());

    auto second = ScopedFileLock::acquire(lock_path, 50);
    ASSERT_FALSE(second);
    EXPECT_EQ(second.error().code(), ErrorCode::ResourceBusy);
}

TEST(FileLockTest, ReleasedOnDestruction)
{
    TempDir dir("hookguard_lock_test");
    const std::string lock_path = dir.file("audit.jsonl.lock");
    {
        auto held = ScopedFileLock::acquire(lock_path, 100);
        ASSERT_TRUE(held);
    }
    auto again = ScopedFileLock::acquire(lock_path, 100);
    EXPECT_TRUE(again);
}

TEST(FileLockTest, AppendRepairsTornTail)
{
    TempDir dir("hookguard_lock_test");
    const std::string path = dir.file("log.jsonl");
    testing_support::write_all(path, "{\"a\":1}\n{\"partial\"");
    ASSERT_TRUE(append_jsonl_line(path, "{\"b\":2}"));
    EXPECT_EQ(testing_support::read_all(path), "{\"a\":1}\n{\"partial\"\n{\"b\":2}\n");
}

} // namespace
} // namespace hookguard

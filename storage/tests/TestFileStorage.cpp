/**
 * @file TestFileStorage.cpp
 * @brief Unit tests for storage::FileStorage durability.
 */

#include <catch2/catch_test_macros.hpp>

#include <tkl/storage/FileStorage.hpp>

#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

using namespace tkl;
using namespace tkl::storage;

namespace {

/// Fresh directory under the system temp dir, removed on scope exit.
class TempDir
{
public:
    explicit TempDir(const std::string& name)
        : _path{std::filesystem::temp_directory_path() /
                ("tkl-" + name + "-" + std::to_string(::getpid()))}
    {
        std::filesystem::remove_all(_path);
    }
    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(_path, ec);
    }

    [[nodiscard]] const std::filesystem::path& path() const { return _path; }

private:
    std::filesystem::path _path;
};

core::Bytes bytesOf(std::string_view text)
{
    const auto* first = reinterpret_cast<const core::byte*>(text.data());
    return core::Bytes(first, first + text.size());
}

} // namespace

TEST_CASE("FileStorage starts empty in a new directory", "[storage][file]")
{
    TempDir dir{"file-empty"};
    auto storage = FileStorage::open(dir.path());
    REQUIRE(storage.has_value());

    REQUIRE((*storage)->getUInt64("ECB:START-TICK").error().isNotFound());
    REQUIRE(std::filesystem::exists(dir.path()));
}

TEST_CASE("FileStorage restores committed state on reopen", "[storage][file]")
{
    TempDir dir{"file-reopen"};
    {
        auto storage = FileStorage::open(dir.path());
        REQUIRE(storage.has_value());

        auto pipe = (*storage)->startTransaction();
        REQUIRE(pipe.has_value());
        REQUIRE((*pipe)->setBytes("ECB:PENDING-TRANSACTIONS", bytesOf("journal")).has_value());
        REQUIRE((*pipe)->increment("ECB:START-TICK").has_value());
        REQUIRE((*pipe)->commit().has_value());
        REQUIRE((*storage)->setUInt64("ECB:END-TICK", 0).has_value());
    }

    auto reopened = FileStorage::open(dir.path());
    REQUIRE(reopened.has_value());
    REQUIRE((*reopened)->getUInt64("ECB:START-TICK").value() == 1);
    REQUIRE((*reopened)->getUInt64("ECB:END-TICK").value() == 0);
    REQUIRE((*reopened)->getBytes("ECB:PENDING-TRANSACTIONS").value() == bytesOf("journal"));
}

TEST_CASE("FileStorage drops an uncommitted pipeline", "[storage][file]")
{
    TempDir dir{"file-uncommitted"};
    {
        auto storage = FileStorage::open(dir.path());
        REQUIRE(storage.has_value());
        REQUIRE((*storage)->setUInt64("ECB:START-TICK", 4).has_value());

        auto pipe = (*storage)->startTransaction();
        REQUIRE(pipe.has_value());
        REQUIRE((*pipe)->increment("ECB:START-TICK").has_value());
        // Never committed: the process "crashes" here.
    }

    auto reopened = FileStorage::open(dir.path());
    REQUIRE(reopened.has_value());
    REQUIRE((*reopened)->getUInt64("ECB:START-TICK").value() == 4);
}

TEST_CASE("FileStorage ignores a leftover temporary image", "[storage][file]")
{
    TempDir dir{"file-leftover"};
    {
        auto storage = FileStorage::open(dir.path());
        REQUIRE(storage.has_value());
        REQUIRE((*storage)->setUInt64("key", 7).has_value());
    }

    const auto temp = dir.path() / (std::string{FileStorage::kImageFileName} + ".tmp");
    {
        std::ofstream out{temp, std::ios::binary};
        out << "half-written";
    }

    auto reopened = FileStorage::open(dir.path());
    REQUIRE(reopened.has_value());
    REQUIRE((*reopened)->getUInt64("key").value() == 7);
    REQUIRE_FALSE(std::filesystem::exists(temp));
}

TEST_CASE("FileStorage reports a damaged image as corrupted", "[storage][file]")
{
    TempDir dir{"file-corrupt"};
    {
        auto storage = FileStorage::open(dir.path());
        REQUIRE(storage.has_value());
        REQUIRE((*storage)->setUInt64("key", 7).has_value());
    }

    const auto image = dir.path() / FileStorage::kImageFileName;
    {
        std::fstream file{image, std::ios::binary | std::ios::in | std::ios::out};
        file.seekp(6);
        file.put('\x7f');
    }

    auto reopened = FileStorage::open(dir.path());
    REQUIRE_FALSE(reopened.has_value());
    REQUIRE(reopened.error().code() == core::ErrorCode::kCorruptedData);
}

TEST_CASE("FileStorage keeps a replaced image when the directory cannot be synced", "[storage][file]")
{
    namespace fs = std::filesystem;

    TempDir dir{"file-dirsync"};
    {
        auto storage = FileStorage::open(dir.path());
        REQUIRE(storage.has_value());

        // Without read permission the directory cannot be opened for fsync,
        // while creating and renaming files inside it still works.
        fs::permissions(dir.path(), fs::perms::owner_write | fs::perms::owner_exec,
                        fs::perm_options::replace);
        const bool unsyncable = ::access(dir.path().c_str(), R_OK) != 0;

        auto pipe = (*storage)->startTransaction();
        REQUIRE(pipe.has_value());
        REQUIRE((*pipe)->increment("ECB:END-TICK").has_value());
        REQUIRE((*pipe)->commit().has_value());
        REQUIRE((*storage)->getUInt64("ECB:END-TICK").value() == 1);

        REQUIRE((*storage)->increment("ECB:END-TICK").value() == 2);
        REQUIRE((*storage)->directorySyncFailures() == (unsyncable ? 2u : 0u));

        fs::permissions(dir.path(), fs::perms::owner_all, fs::perm_options::replace);
    }

    auto reopened = FileStorage::open(dir.path());
    REQUIRE(reopened.has_value());
    REQUIRE((*reopened)->getUInt64("ECB:END-TICK").value() == 2);
    REQUIRE((*reopened)->directorySyncFailures() == 0);
}

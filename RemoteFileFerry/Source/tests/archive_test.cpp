// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <gtest/gtest.h>
#include "../base/archive.h"
#include "memory_connection.h"

using namespace ferry;
using namespace rff;


namespace
{
class ArchiveTest : public testing::Test
{
protected:
    ArchiveTest()
    {
        ServerConfig cfg;
        cfg.host = "src";
        conn_ = std::make_unique<MemoryConnection>(cfg, storage_, callLog_);
        conn_->connect();

        storage_->files["/src/a.txt"] = {"payload of a.txt", 1000};
    }

    size_t countCalls(const std::string& prefix) const
    {
        return std::count_if(callLog_->begin(), callLog_->end(), [&](const std::string& call) { return startsWith(call, prefix); });
    }

    const std::shared_ptr<MemoryStorage> storage_ = std::make_shared<MemoryStorage>();
    const std::shared_ptr<std::vector<std::string>> callLog_ = std::make_shared<std::vector<std::string>>();
    std::unique_ptr<MemoryConnection> conn_;
};
}


TEST_F(ArchiveTest, DisabledDoesNothing)
{
    callLog_->clear();
    EXPECT_EQ(archiveFile(*conn_, "/src/a.txt", "/backup", false, "a.txt", nullptr), ArchiveResult::disabled);

    EXPECT_TRUE(callLog_->empty());
    EXPECT_TRUE(storage_->files.contains("/src/a.txt"));
}


TEST(ArchiveSettings, EnabledRequiresBackupFolder)
{
    ServerConfig cfg;
    EXPECT_FALSE(isArchivingActive(cfg));

    cfg.archiveEnabled = true;
    EXPECT_FALSE(isArchivingActive(cfg));

    cfg.backupDir = "/backup";
    EXPECT_TRUE(isArchivingActive(cfg));

    cfg.archiveEnabled = false;
    EXPECT_FALSE(isArchivingActive(cfg));
}


TEST_F(ArchiveTest, ServerSideMove)
{
    EXPECT_EQ(archiveFile(*conn_, "/src/a.txt", "/backup", true, "a.txt", nullptr), ArchiveResult::moved);

    EXPECT_FALSE(storage_->files.contains("/src/a.txt"));
    ASSERT_TRUE(storage_->files.contains("/backup/a.txt"));
    EXPECT_EQ(storage_->files["/backup/a.txt"].content, "payload of a.txt");
    EXPECT_EQ(countCalls("openRead "), 0u);
}


TEST_F(ArchiveTest, KeepsNameWrittenToDestination)
{
    EXPECT_EQ(archiveFile(*conn_, "/src/a.txt", "/backup", true, "a_20230102-153000.txt", nullptr), ArchiveResult::moved);
    EXPECT_TRUE(storage_->files.contains("/backup/a_20230102-153000.txt"));
}


TEST_F(ArchiveTest, FallbackCopiesVerifiesThenDeletes)
{
    conn_->faults.renameUnsupported = true;
    callLog_->clear();

    EXPECT_EQ(archiveFile(*conn_, "/src/a.txt", "/backup", true, "a.txt", nullptr), ArchiveResult::copied);

    EXPECT_FALSE(storage_->files.contains("/src/a.txt"));
    ASSERT_TRUE(storage_->files.contains("/backup/a.txt"));
    EXPECT_EQ(storage_->files["/backup/a.txt"].content, "payload of a.txt");

    //the copy is read back *before* the source is deleted
    const auto itVerify = std::find(callLog_->begin(), callLog_->end(), "openRead /backup/a.txt");
    const auto itDelete = std::find(callLog_->begin(), callLog_->end(), "remove /src/a.txt");
    ASSERT_NE(itVerify, callLog_->end());
    ASSERT_NE(itDelete, callLog_->end());
    EXPECT_LT(itVerify, itDelete);
}


TEST_F(ArchiveTest, VerificationMismatchKeepsSource)
{
    conn_->faults.renameUnsupported = true;
    conn_->faults.tamperFolder = "/backup/";
    conn_->faults.tamperWrite = [](std::string& block) { block[0] ^= 0x20; };

    EXPECT_THROW(archiveFile(*conn_, "/src/a.txt", "/backup", true, "a.txt", nullptr), ArchiveError);

    ASSERT_TRUE(storage_->files.contains("/src/a.txt"));
    EXPECT_EQ(storage_->files["/src/a.txt"].content, "payload of a.txt");
    EXPECT_FALSE(storage_->files.contains("/backup/a.txt")); //unverified copy removed
    EXPECT_EQ(countCalls("remove /src/"), 0u);
}


TEST_F(ArchiveTest, FailedCopyKeepsSource)
{
    conn_->faults.renameUnsupported = true;
    conn_->faults.failOpenWrite["/backup/a.txt"] = -1;

    EXPECT_THROW(archiveFile(*conn_, "/src/a.txt", "/backup", true, "a.txt", nullptr), ArchiveError);

    EXPECT_TRUE (storage_->files.contains("/src/a.txt"));
    EXPECT_FALSE(storage_->files.contains("/backup/a.txt"));
}


TEST_F(ArchiveTest, MoveErrorBecomesArchiveError)
{
    storage_->files.erase("/src/a.txt"); //rename of a missing file fails

    EXPECT_THROW(archiveFile(*conn_, "/src/a.txt", "/backup", true, "a.txt", nullptr), ArchiveError);
}


TEST_F(ArchiveTest, ConnectionErrorPassesThrough)
{
    conn_->faults.connectionLost = true;
    EXPECT_THROW(archiveFile(*conn_, "/src/a.txt", "/backup", true, "a.txt", nullptr), ConnectionError);

    //connection drops during the fallback copy
    conn_->faults.connectionLost = false;
    conn_->faults.renameUnsupported = true;
    conn_->faults.tamperFolder = "/backup";
    conn_->faults.tamperWrite = [this](std::string& /*block*/) { conn_->faults.connectionLost = true; };

    EXPECT_THROW(archiveFile(*conn_, "/src/a.txt", "/backup", true, "a.txt", nullptr), ConnectionError);
    EXPECT_TRUE(storage_->files.contains("/src/a.txt"));
}

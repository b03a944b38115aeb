// *****************************************************************************
// * This file is part of the RemoteFileFerry project. It is distributed under *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <gtest/gtest.h>
#include "../base/collision.h"
#include "memory_connection.h"
#include "test_status_handler.h"

using namespace ferry;
using namespace rff;


namespace
{
const time_t now = makeUtcTime(2023, 1, 2, 15, 30, 0);


class CollisionTest : public testing::Test
{
protected:
    CollisionTest()
    {
        ServerConfig cfg;
        cfg.host = "dst";
        conn_ = std::make_unique<MemoryConnection>(cfg, storage_, callLog_);
        conn_->connect();
    }

    const std::shared_ptr<MemoryStorage> storage_ = std::make_shared<MemoryStorage>();
    const std::shared_ptr<std::vector<std::string>> callLog_ = std::make_shared<std::vector<std::string>>();
    std::unique_ptr<MemoryConnection> conn_;
    CollisionResolver resolver_{[] { return now; }};
};
}


TEST(CollisionNames, TimeStampInsertedBeforeExtension)
{
    EXPECT_EQ(generateRenamedItemName("report.csv",    "20230102-153000", 0), "report_20230102-153000.csv");
    EXPECT_EQ(generateRenamedItemName("report.csv",    "20230102-153000", 2), "report_20230102-153000_2.csv");
    EXPECT_EQ(generateRenamedItemName("archive.tar.gz", "20230102-153000", 0), "archive.tar_20230102-153000.gz");
    EXPECT_EQ(generateRenamedItemName("README",        "20230102-153000", 0), "README_20230102-153000");
    EXPECT_EQ(generateRenamedItemName(".profile",      "20230102-153000", 1), ".profile_20230102-153000_1");
}


TEST(CollisionNames, TimeStampFormat)
{
    const std::string timeStamp = formatRenameTimeStamp(now);
    ASSERT_EQ(timeStamp.size(), 15u);
    EXPECT_EQ(timeStamp[8], '-');
    EXPECT_EQ(timeStamp, formatTime("%Y%m%d-%H%M%S", getLocalTime(now)));
}


TEST_F(CollisionTest, AbsentTargetAlwaysProceeds)
{
    for (CollisionPolicy policy : {CollisionPolicy::skip, CollisionPolicy::overwrite, CollisionPolicy::rename})
    {
        const EffectiveAction action = resolver_.resolve(*conn_, "/dst/report.csv", policy);
        EXPECT_EQ(action.type, EffectiveAction::Type::proceed);
        EXPECT_EQ(action.targetPath, "/dst/report.csv");
        EXPECT_FALSE(action.replacesExisting);
        EXPECT_FALSE(action.renamed);
    }
    EXPECT_EQ(std::count(callLog_->begin(), callLog_->end(), "exists /dst/report.csv"), 3);
}


TEST_F(CollisionTest, ExistingTargetSkip)
{
    storage_->files["/dst/report.csv"] = {"old", 0};

    const EffectiveAction action = resolver_.resolve(*conn_, "/dst/report.csv", CollisionPolicy::skip);
    EXPECT_EQ(action.type, EffectiveAction::Type::skip);
}


TEST_F(CollisionTest, ExistingTargetOverwrite)
{
    storage_->files["/dst/report.csv"] = {"old", 0};

    const EffectiveAction action = resolver_.resolve(*conn_, "/dst/report.csv", CollisionPolicy::overwrite);
    EXPECT_EQ(action.type, EffectiveAction::Type::proceed);
    EXPECT_EQ(action.targetPath, "/dst/report.csv");
    EXPECT_FALSE(action.renamed);
    EXPECT_TRUE(action.replacesExisting);
}


TEST_F(CollisionTest, ExistingTargetRenameEncodesTimeStamp)
{
    storage_->files["/dst/report.csv"] = {"old", 0};

    const EffectiveAction action = resolver_.resolve(*conn_, "/dst/report.csv", CollisionPolicy::rename);
    EXPECT_EQ(action.type, EffectiveAction::Type::proceed);
    EXPECT_TRUE(action.renamed);
    EXPECT_NE(action.targetPath, "/dst/report.csv");
    EXPECT_EQ(action.targetPath, "/dst/report_" + formatRenameTimeStamp(now) + ".csv");
}


TEST_F(CollisionTest, RenamedPathAlsoExists)
{
    const std::string timeStamp = formatRenameTimeStamp(now);
    storage_->files["/dst/report.csv"] = {"old", 0};
    storage_->files["/dst/report_" + timeStamp + ".csv"] = {"older", 0};
    storage_->files["/dst/report_" + timeStamp + "_1.csv"] = {"oldest", 0};

    const EffectiveAction action = resolver_.resolve(*conn_, "/dst/report.csv", CollisionPolicy::rename);
    EXPECT_EQ(action.targetPath, "/dst/report_" + timeStamp + "_2.csv");
}


TEST_F(CollisionTest, RenamesWithinRunNeverCollide)
{
    storage_->files["/dst/report.csv"] = {"old", 0};

    //same clock second, nothing written yet: must still be distinct
    const EffectiveAction action1 = resolver_.resolve(*conn_, "/dst/report.csv", CollisionPolicy::rename);
    const EffectiveAction action2 = resolver_.resolve(*conn_, "/dst/report.csv", CollisionPolicy::rename);
    const EffectiveAction action3 = resolver_.resolve(*conn_, "/dst/report.csv", CollisionPolicy::rename);

    EXPECT_NE(action1.targetPath, action2.targetPath);
    EXPECT_NE(action2.targetPath, action3.targetPath);
    EXPECT_NE(action1.targetPath, action3.targetPath);

    //a reserved name counts as taken even if the upload never happened
    const EffectiveAction action4 = resolver_.resolve(*conn_, action1.targetPath, CollisionPolicy::skip);
    EXPECT_EQ(action4.type, EffectiveAction::Type::skip);
}


TEST_F(CollisionTest, ExistenceCheckErrorsPropagate)
{
    conn_->faults.failExists["/dst/report.csv"] = 1;
    EXPECT_THROW(resolver_.resolve(*conn_, "/dst/report.csv", CollisionPolicy::rename), RemoteIOError);

    conn_->faults.connectionLost = true;
    EXPECT_THROW(resolver_.resolve(*conn_, "/dst/report.csv", CollisionPolicy::rename), ConnectionError);
}

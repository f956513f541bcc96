#include "support/MemoryFilesystem.hpp"
#include "sync/Controller.hpp"
#include "sync/errors.hpp"
#include "sync/interrupt.hpp"
#include "sync/model/Event.hpp"

#include <gtest/gtest.h>

using namespace ds::test;
using namespace ds::sync;
using namespace ds::sync::model;

using Pairs = std::vector<PathPair>;

class ControllerTest : public ::testing::Test {
protected:
    std::shared_ptr<MemoryFilesystem> local = std::make_shared<MemoryFilesystem>("local");
    std::shared_ptr<MemoryFilesystem> remote = std::make_shared<MemoryFilesystem>("remote");
    Controller controller{local, remote};

    void SetUp() override { MemoryFilesystem::connect(local, remote); }
    void TearDown() override { interrupt::reset(); }

    static Request request(std::vector<std::string> sources, std::string destination) {
        Request req;
        req.sources = std::move(sources);
        req.destination = std::move(destination);
        return req;
    }
};

TEST_F(ControllerTest, TrailingSlashSyncsContents) {
    EXPECT_EQ(Controller::resolvePairs(request({"/l/"}, "/r")), (Pairs{{"/l", "/r"}}));
    EXPECT_EQ(Controller::resolvePairs(request({"/l/."}, "/r/")), (Pairs{{"/l/.", "/r"}}));
}

TEST_F(ControllerTest, BareSourceSyncsIntoNamedChild) {
    EXPECT_EQ(Controller::resolvePairs(request({"/home/me/photos", "notes.txt"}, "/sdcard/")),
              (Pairs{{"/home/me/photos", "/sdcard/photos"}, {"notes.txt", "/sdcard/notes.txt"}}));
}

TEST_F(ControllerTest, ReverseSwapsRoles) {
    auto req = request({"/sdcard/DCIM"}, "backup");
    req.reverse = true;
    req.policy.localToRemote = false;
    req.policy.remoteToLocal = true;

    EXPECT_EQ(Controller::resolvePairs(req), (Pairs{{"backup/DCIM", "/sdcard/DCIM"}}));
}

TEST_F(ControllerTest, DuplicateDestinationsRejectedWhenDeleting) {
    auto req = request({"a/x", "b/x"}, "/r");
    EXPECT_EQ(Controller::resolvePairs(req).size(), 2u);

    req.policy.deleteExtraneous = true;
    EXPECT_THROW(Controller::resolvePairs(req), ConfigConflict);

    req.policy.deleteExtraneous = false;
    req.policy.remoteToLocal = true;
    EXPECT_THROW(Controller::resolvePairs(req), ConfigConflict);
}

TEST_F(ControllerTest, EmptyPathsRejected) {
    EXPECT_THROW(Controller::resolvePairs(request({}, "/r")), ConfigConflict);
    EXPECT_THROW(Controller::resolvePairs(request({"/l"}, "")), ConfigConflict);
    EXPECT_THROW(Controller::resolvePairs(request({""}, "/r")), ConfigConflict);
}

TEST_F(ControllerTest, RunSyncsAndIsIdempotent) {
    local->addFile("/l/a/b.txt", 10);
    local->addFile("/l/c.txt", 20);

    EXPECT_EQ(controller.run(request({"/l/"}, "/r")), Controller::Outcome::Success);
    EXPECT_EQ(remote->tree("/r"), (std::set<std::string>{"a", "a/b.txt", "c.txt"}));

    remote->calls.clear();
    local->calls.clear();

    EXPECT_EQ(controller.run(request({"/l/"}, "/r")), Controller::Outcome::Success);
    EXPECT_TRUE(remote->calls.empty());
    EXPECT_TRUE(local->calls.empty());

    ASSERT_EQ(controller.events().size(), 2u);
    EXPECT_EQ(controller.events()[0]->bytes_transferred, 30u);
    EXPECT_EQ(controller.events()[1]->bytes_transferred, 0u);
}

TEST_F(ControllerTest, EveryScanStartsFromFreshCaches) {
    local->addDir("/l");
    controller.run(request({"/l/"}, "/r"));

    EXPECT_EQ(local->invalidations, 1);
    EXPECT_EQ(remote->invalidations, 1);
}

TEST_F(ControllerTest, ConflictingOptionsFailBeforeAnyIo) {
    local->addFile("/l/a", 1);
    auto req = request({"/l/"}, "/r");
    req.policy.remoteToLocal = true;
    req.policy.deleteExtraneous = true;

    EXPECT_EQ(controller.run(req), Controller::Outcome::Failed);
    EXPECT_TRUE(controller.events().empty());
    EXPECT_EQ(remote->invalidations, 0);
}

TEST_F(ControllerTest, FailedSelfTestAborts) {
    local->addFile("/l/a", 1);
    remote->selfTestResult = false;

    EXPECT_EQ(controller.run(request({"/l/"}, "/r")), Controller::Outcome::Failed);
    EXPECT_TRUE(controller.events().empty());
    EXPECT_TRUE(remote->calls.empty());
}

TEST_F(ControllerTest, FailedPairDoesNotStopOthers) {
    local->addFile("/l/one/big.bin", 100);
    local->addFile("/l/two/small.bin", 1);
    remote->addDir("/r");
    remote->failCopies.insert("/r/one/big.bin");

    EXPECT_EQ(controller.run(request({"/l/one", "/l/two"}, "/r")), Controller::Outcome::Failed);

    ASSERT_EQ(controller.events().size(), 2u);
    EXPECT_EQ(controller.events()[0]->status, Event::Status::ERROR);
    EXPECT_FALSE(controller.events()[0]->error_message.empty());
    EXPECT_EQ(controller.events()[1]->status, Event::Status::SUCCESS);

    EXPECT_FALSE(remote->exists("/r/one/big.bin"));
    EXPECT_TRUE(remote->exists("/r/two/small.bin"));
}

TEST_F(ControllerTest, InterruptPropagatesAndCancelsEvent) {
    local->addFile("/l/a.bin", 100);
    local->addFile("/l/b.bin", 100);
    remote->addDir("/r");
    remote->failCopies.insert("/r/a.bin");
    remote->onCopyFailure = [](const std::string&) { interrupt::request(); };

    EXPECT_THROW(controller.run(request({"/l/"}, "/r")), Interrupted);

    ASSERT_EQ(controller.events().size(), 1u);
    EXPECT_EQ(controller.events()[0]->status, Event::Status::CANCELLED);
    EXPECT_FALSE(remote->exists("/r/a.bin"));
    EXPECT_FALSE(remote->exists("/r/b.bin"));
}

TEST_F(ControllerTest, UnresolvedConflictsAreCountedNotFatal) {
    local->addFile("/l/f", 1, 600);
    remote->addFile("/r/f", 2, 610);
    auto req = request({"/l/"}, "/r");
    req.policy.remoteToLocal = true;

    EXPECT_EQ(controller.run(req), Controller::Outcome::Success);
    ASSERT_EQ(controller.events().size(), 1u);
    EXPECT_EQ(controller.events()[0]->num_unresolved, 1u);
}

TEST_F(ControllerTest, MissingSourceWithDeleteLeavesDestinationAlone) {
    remote->addFile("/r/keep.txt", 1);
    auto req = request({"/l/"}, "/r");
    req.policy.deleteExtraneous = true;

    EXPECT_EQ(controller.run(req), Controller::Outcome::Success);
    EXPECT_TRUE(remote->exists("/r/keep.txt"));
}

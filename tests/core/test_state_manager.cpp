//===== test_state_manager.cpp =====
#include <gtest/gtest.h>
#include <algorithm>
#include "quote_ngin/core/state_manager.hpp"

using namespace quote_ngin;

class StateManagerTest : public ::testing::Test {
protected:
    ComponentInfo make_info(const std::string& id,
                            ComponentState state = ComponentState::CREATED) {
        return ComponentInfo{ComponentType::PROCESSOR, state, id, "",
                             std::chrono::system_clock::now(), {}};
    }

    StateManager states_;
};

TEST_F(StateManagerTest, RegisterComponentSuccess) {
    auto result = states_.register_component(make_info("processor"));
    EXPECT_TRUE(result.is_ok());

    auto info = states_.get_state("processor");
    ASSERT_TRUE(info.is_ok());
    EXPECT_EQ(info.value().state, ComponentState::CREATED);
}

TEST_F(StateManagerTest, RegisterDuplicateComponent) {
    ASSERT_TRUE(states_.register_component(make_info("processor")).is_ok());
    auto result = states_.register_component(make_info("processor"));
    EXPECT_TRUE(result.is_error());
}

TEST_F(StateManagerTest, RegisterEmptyIdFails) {
    auto result = states_.register_component(make_info(""));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(StateManagerTest, LifecycleTransitions) {
    ASSERT_TRUE(states_.register_component(make_info("sink")).is_ok());

    EXPECT_TRUE(states_.update_state("sink", ComponentState::STARTED).is_ok());
    EXPECT_TRUE(states_.update_state("sink", ComponentState::RUNNING).is_ok());
    EXPECT_TRUE(states_.update_state("sink", ComponentState::STOPPING, "boom").is_ok());
    EXPECT_TRUE(states_.update_state("sink", ComponentState::STOPPED, "boom").is_ok());

    auto stopped = states_.get_state("sink");
    ASSERT_TRUE(stopped.is_ok());
    EXPECT_EQ(stopped.value().error_message, "boom");

    // A restart clears the failure
    EXPECT_TRUE(states_.update_state("sink", ComponentState::STARTED).is_ok());
    auto restarted = states_.get_state("sink");
    ASSERT_TRUE(restarted.is_ok());
    EXPECT_TRUE(restarted.value().error_message.empty());
}

TEST_F(StateManagerTest, InvalidTransitionsRejected) {
    ASSERT_TRUE(states_.register_component(make_info("sink")).is_ok());

    EXPECT_TRUE(states_.update_state("sink", ComponentState::RUNNING).is_error());
    ASSERT_TRUE(states_.update_state("sink", ComponentState::STARTED).is_ok());
    EXPECT_TRUE(states_.update_state("sink", ComponentState::CREATED).is_error());
    EXPECT_TRUE(states_.update_state("sink", ComponentState::STOPPED).is_error());
}

TEST_F(StateManagerTest, StartFailureGoesStraightToStopped) {
    ASSERT_TRUE(states_.register_component(make_info("file_sink")).is_ok());
    EXPECT_TRUE(states_.update_state("file_sink", ComponentState::STOPPED, "no disk").is_ok());
}

TEST_F(StateManagerTest, UnknownComponent) {
    EXPECT_TRUE(states_.get_state("missing").is_error());
    EXPECT_TRUE(states_.update_state("missing", ComponentState::STARTED).is_error());
    EXPECT_TRUE(states_.increment_metric("missing", "processed").is_error());
}

TEST_F(StateManagerTest, Metrics) {
    ASSERT_TRUE(states_.register_component(make_info("downloader_1")).is_ok());

    ASSERT_TRUE(states_.increment_metric("downloader_1", "processed").is_ok());
    ASSERT_TRUE(states_.increment_metric("downloader_1", "processed").is_ok());
    ASSERT_TRUE(states_.increment_metric("downloader_1", "restarts", 3.0).is_ok());

    auto info = states_.get_state("downloader_1");
    ASSERT_TRUE(info.is_ok());
    EXPECT_DOUBLE_EQ(info.value().metrics.at("processed"), 2.0);
    EXPECT_DOUBLE_EQ(info.value().metrics.at("restarts"), 3.0);
}

TEST_F(StateManagerTest, ComponentHealth) {
    EXPECT_FALSE(states_.is_healthy());

    ASSERT_TRUE(states_.register_component(make_info("a", ComponentState::STARTED)).is_ok());
    ASSERT_TRUE(states_.register_component(make_info("b", ComponentState::RUNNING)).is_ok());
    EXPECT_TRUE(states_.is_healthy());

    ASSERT_TRUE(states_.update_state("b", ComponentState::STOPPING).is_ok());
    EXPECT_FALSE(states_.is_healthy());
}

TEST_F(StateManagerTest, ListsComponents) {
    ASSERT_TRUE(states_.register_component(make_info("a")).is_ok());
    ASSERT_TRUE(states_.register_component(make_info("b")).is_ok());

    auto ids = states_.get_all_components();
    std::sort(ids.begin(), ids.end());
    EXPECT_EQ(ids, (std::vector<std::string>{"a", "b"}));

    EXPECT_TRUE(states_.register_component(make_info("a")).is_error());
    EXPECT_EQ(states_.get_all_components().size(), 2u);
}

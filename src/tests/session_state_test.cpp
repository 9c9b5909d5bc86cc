#include <gtest/gtest.h>
#include "chainvault/network/session_state.hpp"

using namespace chainvault::network;

class SessionStateTest : public ::testing::Test {
protected:
    SessionState state;
};

// Test initial state
TEST_F(SessionStateTest, InitialState) {
    EXPECT_EQ(state.get_state(), SessionState::State::AWAITING_COMMAND);
    EXPECT_EQ(state.get_state_string(), "AWAITING_COMMAND");
    EXPECT_FALSE(state.is_terminal());
}

// Every command returns to AWAITING_COMMAND
TEST_F(SessionStateTest, CommandsReturnToIdle) {
    for (auto command : {SessionState::State::ADDING, SessionState::State::CHECKING, SessionState::State::GETTING}) {
        EXPECT_TRUE(state.transition_to(command)) << command;
        EXPECT_EQ(state.get_state(), command);
        EXPECT_TRUE(state.transition_to(SessionState::State::AWAITING_COMMAND));
    }
}

// Commands cannot nest
TEST_F(SessionStateTest, InvalidTransitions) {
    EXPECT_FALSE(state.transition_to(SessionState::State::AWAITING_COMMAND));

    EXPECT_TRUE(state.transition_to(SessionState::State::ADDING));
    EXPECT_FALSE(state.transition_to(SessionState::State::GETTING));
    EXPECT_FALSE(state.transition_to(SessionState::State::ADDING));
    EXPECT_EQ(state.get_state(), SessionState::State::ADDING);
}

// Closed is terminal
TEST_F(SessionStateTest, ClosedIsTerminal) {
    EXPECT_TRUE(state.transition_to(SessionState::State::GETTING));
    EXPECT_TRUE(state.transition_to(SessionState::State::CLOSED));
    EXPECT_TRUE(state.is_terminal());

    EXPECT_FALSE(state.transition_to(SessionState::State::AWAITING_COMMAND));
    EXPECT_FALSE(state.transition_to(SessionState::State::CLOSED));
    EXPECT_EQ(state.get_state_string(), "CLOSED");
}

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Test runner: sets up logging around the Catch2 session

#include <catch2/catch_session.hpp>
#include <cstdlib>
#include <string>

void InitializeTestLogging(const std::string& level);
void ShutdownTestLogging();

int main(int argc, char* argv[]) {
    // LIGHTWALLET_TEST_LOG_LEVEL=trace|debug|info|warn|error|off
    const char* env_level = std::getenv("LIGHTWALLET_TEST_LOG_LEVEL");
    InitializeTestLogging(env_level ? env_level : "off");

    int result = Catch::Session().run(argc, argv);

    ShutdownTestLogging();
    return result;
}

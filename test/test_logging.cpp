// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Test logging initialization helpers

#include "util/logging.hpp"
#include <string>

// Initialize logging for tests (console only, no file)
void InitializeTestLogging(const std::string& level) {
    svcnet::util::LogManager::Initialize(level, false, "");

    // "trace" also lowers every component, so LOG_ORCH_TRACE etc. show up
    if (level == "trace") {
        for (const char* component : {"graph", "orchestrator", "docker", "app"}) {
            svcnet::util::LogManager::SetComponentLevel(component, "trace");
        }
    }
}

// Shutdown logging system after tests complete
void ShutdownTestLogging() {
    svcnet::util::LogManager::Shutdown();
}

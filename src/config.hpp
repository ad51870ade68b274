#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include <mw/error.hpp>

constexpr char DEFAULT_VERIFIER_URL[] = "https://verifier.openbotauth.org/verify";

enum class EnforcementMode
{
    // Record the outcome, never block.
    OBSERVE,
    // Block unsigned requests and requests that fail verification.
    REQUIRE,
};

// Accepts "observe", "require" and "require-verified".
mw::E<EnforcementMode> parseMode(std::string_view s);
std::string_view modeStr(EnforcementMode mode);

// Fixed for the lifetime of the process and handed to the components that
// need it at construction.
struct EnforcementConfig
{
    std::string verifier_url = DEFAULT_VERIFIER_URL;
    EnforcementMode mode = EnforcementMode::OBSERVE;
    std::chrono::milliseconds timeout{5000};

    mw::E<void> validate() const;
};

struct SidecarConfig
{
    std::string listen_address = "0.0.0.0";
    int port = 8088;
    std::string upstream_url = "http://localhost:8080";
    // Path prefixes enforced in require mode. Other paths are only observed.
    std::vector<std::string> protected_paths = {"/protected"};
    std::string log_level = "info";
    EnforcementConfig enforcement;

    // Overlay values from a YAML file.
    mw::E<void> loadYAML(const std::string& path);
    // Overlay values from PORT, UPSTREAM_URL, OBA_VERIFIER_URL, OBA_MODE,
    // OBA_TIMEOUT_MS and OBA_PROTECTED_PATHS.
    mw::E<void> loadEnv();
    mw::E<void> validate() const;
};

// Parse a comma separated list of path prefixes, dropping blanks.
std::vector<std::string> parsePathList(std::string_view s);

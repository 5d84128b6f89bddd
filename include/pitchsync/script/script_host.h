#pragma once

#include "core/tick_context.h"

#include <cstdint>
#include <filesystem>
#include <string>

namespace pitchsync::script {

inline constexpr const char* kScriptApiVersion = "1.0.0";

struct ScriptEvent final {
    std::string event_name;
    std::string payload;
};

struct ScriptSource final {
    std::string chunk_name;
    std::string source_code;
};

struct ScriptRuntimeDescriptor final {
    std::string backend_name = "unknown";
    std::string api_version = kScriptApiVersion;
    bool sandbox_enabled = false;
    std::string sandbox_level = "none";
    std::uint64_t memory_budget_bytes = 0;
    std::uint64_t instruction_budget_per_call = 0;
    bool rules_loaded = false;
    bool has_tick_handler = false;
    bool has_event_handler = false;
};

class IScriptHost {
public:
    virtual ~IScriptHost() = default;

    virtual bool SetRulesScript(ScriptSource source, std::string& out_error) = 0;
    virtual bool Initialize(std::string& out_error) = 0;
    virtual void Shutdown() = 0;
    virtual void Tick(const core::TickContext& tick_context) = 0;
    virtual void DispatchEvent(const ScriptEvent& event_data) = 0;
    virtual ScriptRuntimeDescriptor RuntimeDescriptor() const = 0;
};

bool LoadScriptSourceFile(
    const std::filesystem::path& file_path,
    ScriptSource& out_source,
    std::string& out_error);

}  // namespace pitchsync::script

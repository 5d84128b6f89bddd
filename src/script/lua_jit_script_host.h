#pragma once

#include "script/script_host.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

struct lua_State;

namespace pitchsync::script {

class LuaJitScriptHost final : public IScriptHost {
public:
    static constexpr std::size_t kMaxPendingEvents = 1024;
    static constexpr std::size_t kInstructionBudgetPerCall = 200000;
    static constexpr std::size_t kMemoryBudgetBytes = 16 * 1024 * 1024;

    bool SetRulesScript(ScriptSource source, std::string& out_error) override;
    bool Initialize(std::string& out_error) override;
    void Shutdown() override;
    void Tick(const core::TickContext& tick_context) override;
    void DispatchEvent(const ScriptEvent& event_data) override;
    ScriptRuntimeDescriptor RuntimeDescriptor() const override;

    // Reads a top-level value from the rules environment as text.
    bool TryReadRulesValue(
        std::string_view field_name,
        std::string& out_value,
        std::string& out_error) const;

    bool IsVmReady() const;
    std::size_t PendingEventCount() const;
    std::size_t TotalProcessedEventCount() const;
    std::size_t DroppedEventCount() const;
    std::size_t FailedCallCount() const;

private:
    struct MemoryQuotaState final {
        std::size_t bytes_in_use = 0;
        std::size_t limit_bytes = kMemoryBudgetBytes;
    };

    static void* QuotaAllocator(void* user_data, void* pointer, size_t old_size, size_t new_size);
    bool ApplySandbox(std::string& out_error);
    void RegisterHostFunctions();
    bool BindRulesEnvironment(std::string& out_error);
    bool LoadRulesChunk(std::string& out_error);
    void DetectHandlers();
    void ReleaseRulesEnvironment();
    bool InvokeTickHandler(const core::TickContext& tick_context, std::string& out_error);
    bool InvokeEventHandler(const ScriptEvent& event_data, std::string& out_error);

    bool initialized_ = false;
    lua_State* lua_state_ = nullptr;
    ScriptSource rules_source_;
    bool has_rules_source_ = false;
    int environment_ref_ = -1;
    bool has_tick_handler_ = false;
    bool has_event_handler_ = false;
    MemoryQuotaState memory_quota_state_{};
    std::vector<ScriptEvent> pending_events_;
    std::size_t total_processed_event_count_ = 0;
    std::size_t dropped_event_count_ = 0;
    std::size_t failed_call_count_ = 0;
};

}  // namespace pitchsync::script

#include "script/lua_jit_script_host.h"

#include "core/logger.h"

#include <cstdlib>
#include <string>
#include <utility>

extern "C" {
#include <lauxlib.h>
#include <lua.h>
#include <lualib.h>
}

namespace pitchsync::script {
namespace {

constexpr const char* kTickHandlerName = "on_tick";
constexpr const char* kEventHandlerName = "on_event";

std::string ReadLuaError(lua_State* lua_state) {
    const char* error_message = lua_tostring(lua_state, -1);
    std::string output = error_message != nullptr ? error_message : "unknown LuaJIT error";
    lua_pop(lua_state, 1);
    return output;
}

void ClearGlobal(lua_State* lua_state, const char* global_name) {
    lua_pushnil(lua_state);
    lua_setglobal(lua_state, global_name);
}

void InstructionBudgetHook(lua_State* lua_state, lua_Debug* debug) {
    (void)debug;
    luaL_error(lua_state, "instruction budget exceeded");
}

bool RunProtectedLuaCall(
    lua_State* lua_state,
    int instruction_budget_per_call,
    int argument_count,
    std::string& out_error) {
    lua_sethook(lua_state, InstructionBudgetHook, LUA_MASKCOUNT, instruction_budget_per_call);
    const int run_status = lua_pcall(lua_state, argument_count, 0, 0);
    lua_sethook(lua_state, nullptr, 0, 0);
    if (run_status != LUA_OK) {
        out_error = ReadLuaError(lua_state);
        return false;
    }

    out_error.clear();
    return true;
}

int HostLog(lua_State* lua_state) {
    const char* message = luaL_checkstring(lua_state, 1);
    core::Logger::Info("script", message);
    return 0;
}

int HostWarn(lua_State* lua_state) {
    const char* message = luaL_checkstring(lua_state, 1);
    core::Logger::Warn("script", message);
    return 0;
}

}  // namespace

void* LuaJitScriptHost::QuotaAllocator(
    void* user_data,
    void* pointer,
    size_t old_size,
    size_t new_size) {
    auto* quota_state = static_cast<MemoryQuotaState*>(user_data);
    if (quota_state == nullptr) {
        return nullptr;
    }

    if (new_size == 0) {
        if (pointer != nullptr) {
            std::free(pointer);
        }
        if (old_size <= quota_state->bytes_in_use) {
            quota_state->bytes_in_use -= old_size;
        } else {
            quota_state->bytes_in_use = 0;
        }
        return nullptr;
    }

    if (new_size > old_size) {
        const std::size_t growth_size = new_size - old_size;
        if (quota_state->bytes_in_use + growth_size > quota_state->limit_bytes) {
            return nullptr;
        }
    }

    void* new_pointer = std::realloc(pointer, new_size);
    if (new_pointer == nullptr) {
        return nullptr;
    }

    if (new_size >= old_size) {
        quota_state->bytes_in_use += (new_size - old_size);
    } else {
        quota_state->bytes_in_use -= (old_size - new_size);
    }

    return new_pointer;
}

bool LuaJitScriptHost::SetRulesScript(ScriptSource source, std::string& out_error) {
    if (initialized_) {
        out_error = "Rules script must be set before the script host is initialized.";
        return false;
    }
    if (source.source_code.empty()) {
        out_error = "Rules script source is empty.";
        return false;
    }
    if (source.chunk_name.empty()) {
        source.chunk_name = "rules";
    }

    rules_source_ = std::move(source);
    has_rules_source_ = true;
    out_error.clear();
    return true;
}

bool LuaJitScriptHost::Initialize(std::string& out_error) {
    pending_events_.clear();
    total_processed_event_count_ = 0;
    dropped_event_count_ = 0;
    failed_call_count_ = 0;
    has_tick_handler_ = false;
    has_event_handler_ = false;
    environment_ref_ = LUA_NOREF;

    memory_quota_state_.bytes_in_use = 0;
    memory_quota_state_.limit_bytes = kMemoryBudgetBytes;
    lua_state_ = lua_newstate(QuotaAllocator, &memory_quota_state_);
    if (lua_state_ == nullptr) {
        initialized_ = false;
        out_error =
            "lua_newstate failed (memory budget=" +
            std::to_string(memory_quota_state_.limit_bytes) + ").";
        return false;
    }

    luaL_openlibs(lua_state_);
    if (!ApplySandbox(out_error)) {
        lua_close(lua_state_);
        lua_state_ = nullptr;
        initialized_ = false;
        return false;
    }
    RegisterHostFunctions();

    if (has_rules_source_ && !LoadRulesChunk(out_error)) {
        lua_close(lua_state_);
        lua_state_ = nullptr;
        environment_ref_ = LUA_NOREF;
        initialized_ = false;
        return false;
    }

    initialized_ = true;
    out_error.clear();
    core::Logger::Info(
        "script",
        has_rules_source_
            ? "LuaJIT script host initialized with rules '" + rules_source_.chunk_name + "'."
            : std::string("LuaJIT script host initialized without rules."));
    return true;
}

void LuaJitScriptHost::Shutdown() {
    if (!initialized_) {
        return;
    }

    if (lua_state_ != nullptr) {
        ReleaseRulesEnvironment();
        lua_close(lua_state_);
        lua_state_ = nullptr;
    }

    pending_events_.clear();
    memory_quota_state_.bytes_in_use = 0;
    initialized_ = false;
    core::Logger::Info("script", "LuaJIT script host shutdown.");
}

void LuaJitScriptHost::Tick(const core::TickContext& tick_context) {
    if (!initialized_) {
        return;
    }

    std::string call_error;
    if (!InvokeTickHandler(tick_context, call_error)) {
        ++failed_call_count_;
        core::Logger::Warn("script", "LuaJIT tick handler failed: " + call_error);
    }

    for (const ScriptEvent& event_data : pending_events_) {
        if (!InvokeEventHandler(event_data, call_error)) {
            ++failed_call_count_;
            core::Logger::Warn(
                "script",
                "LuaJIT event handler failed (" + event_data.event_name + "): " + call_error);
        }
    }

    total_processed_event_count_ += pending_events_.size();
    pending_events_.clear();
}

void LuaJitScriptHost::DispatchEvent(const ScriptEvent& event_data) {
    if (!initialized_) {
        return;
    }

    if (pending_events_.size() >= kMaxPendingEvents) {
        ++dropped_event_count_;
        return;
    }

    pending_events_.push_back(event_data);
}

ScriptRuntimeDescriptor LuaJitScriptHost::RuntimeDescriptor() const {
    return ScriptRuntimeDescriptor{
        .backend_name = "luajit",
        .api_version = kScriptApiVersion,
        .sandbox_enabled = true,
        .sandbox_level = "resource_limited",
        .memory_budget_bytes = kMemoryBudgetBytes,
        .instruction_budget_per_call = kInstructionBudgetPerCall,
        .rules_loaded = environment_ref_ != LUA_NOREF && environment_ref_ != LUA_REFNIL,
        .has_tick_handler = has_tick_handler_,
        .has_event_handler = has_event_handler_,
    };
}

bool LuaJitScriptHost::TryReadRulesValue(
    std::string_view field_name,
    std::string& out_value,
    std::string& out_error) const {
    if (!IsVmReady() || environment_ref_ == LUA_NOREF || environment_ref_ == LUA_REFNIL) {
        out_error = "Rules environment is not loaded.";
        return false;
    }

    const std::string field(field_name);
    lua_rawgeti(lua_state_, LUA_REGISTRYINDEX, environment_ref_);
    lua_getfield(lua_state_, -1, field.c_str());
    if (lua_isnil(lua_state_, -1)) {
        lua_pop(lua_state_, 2);
        out_error = "Rules value is not defined: " + field;
        return false;
    }
    if (lua_isboolean(lua_state_, -1)) {
        out_value = lua_toboolean(lua_state_, -1) != 0 ? "true" : "false";
        lua_pop(lua_state_, 2);
        out_error.clear();
        return true;
    }

    const char* text = lua_tostring(lua_state_, -1);
    if (text == nullptr) {
        lua_pop(lua_state_, 2);
        out_error = "Rules value is not a scalar: " + field;
        return false;
    }

    out_value = text;
    lua_pop(lua_state_, 2);
    out_error.clear();
    return true;
}

bool LuaJitScriptHost::IsVmReady() const {
    return initialized_ && lua_state_ != nullptr;
}

std::size_t LuaJitScriptHost::PendingEventCount() const {
    return pending_events_.size();
}

std::size_t LuaJitScriptHost::TotalProcessedEventCount() const {
    return total_processed_event_count_;
}

std::size_t LuaJitScriptHost::DroppedEventCount() const {
    return dropped_event_count_;
}

std::size_t LuaJitScriptHost::FailedCallCount() const {
    return failed_call_count_;
}

bool LuaJitScriptHost::ApplySandbox(std::string& out_error) {
    if (lua_state_ == nullptr) {
        out_error = "Lua state is null.";
        return false;
    }

    ClearGlobal(lua_state_, "io");
    ClearGlobal(lua_state_, "os");
    ClearGlobal(lua_state_, "debug");
    ClearGlobal(lua_state_, "package");
    ClearGlobal(lua_state_, "dofile");
    ClearGlobal(lua_state_, "loadfile");
    ClearGlobal(lua_state_, "load");
    ClearGlobal(lua_state_, "loadstring");
    ClearGlobal(lua_state_, "require");
    ClearGlobal(lua_state_, "collectgarbage");
    ClearGlobal(lua_state_, "jit");

    lua_getglobal(lua_state_, "string");
    if (lua_istable(lua_state_, -1)) {
        lua_pushnil(lua_state_);
        lua_setfield(lua_state_, -2, "dump");
    }
    lua_pop(lua_state_, 1);

    out_error.clear();
    return true;
}

void LuaJitScriptHost::RegisterHostFunctions() {
    lua_newtable(lua_state_);
    lua_pushcfunction(lua_state_, HostLog);
    lua_setfield(lua_state_, -2, "log");
    lua_pushcfunction(lua_state_, HostWarn);
    lua_setfield(lua_state_, -2, "warn");
    lua_pushstring(lua_state_, kScriptApiVersion);
    lua_setfield(lua_state_, -2, "api_version");
    lua_setglobal(lua_state_, "host");
}

bool LuaJitScriptHost::BindRulesEnvironment(std::string& out_error) {
    if (!lua_isfunction(lua_state_, -1)) {
        out_error = "Rules chunk is not on stack.";
        return false;
    }

    lua_newtable(lua_state_);
    lua_pushvalue(lua_state_, -1);
    lua_setfield(lua_state_, -2, "_G");

    lua_newtable(lua_state_);
    lua_pushvalue(lua_state_, LUA_GLOBALSINDEX);
    lua_setfield(lua_state_, -2, "__index");
    lua_setmetatable(lua_state_, -2);

    lua_pushvalue(lua_state_, -1);
    if (lua_setfenv(lua_state_, -3) == 0) {
        lua_pop(lua_state_, 1);
        out_error = "Failed to bind rules environment.";
        return false;
    }

    environment_ref_ = luaL_ref(lua_state_, LUA_REGISTRYINDEX);
    out_error.clear();
    return true;
}

bool LuaJitScriptHost::LoadRulesChunk(std::string& out_error) {
    const int load_status = luaL_loadbuffer(
        lua_state_,
        rules_source_.source_code.c_str(),
        rules_source_.source_code.size(),
        rules_source_.chunk_name.c_str());
    if (load_status != LUA_OK) {
        out_error =
            "Failed to compile rules '" + rules_source_.chunk_name + "': " +
            ReadLuaError(lua_state_);
        return false;
    }

    if (!BindRulesEnvironment(out_error)) {
        lua_pop(lua_state_, 1);
        out_error =
            "Failed to isolate rules '" + rules_source_.chunk_name + "': " + out_error;
        return false;
    }

    if (!RunProtectedLuaCall(
            lua_state_,
            static_cast<int>(kInstructionBudgetPerCall),
            0,
            out_error)) {
        ReleaseRulesEnvironment();
        out_error = "Failed to run rules '" + rules_source_.chunk_name + "': " + out_error;
        if (out_error.find("memory") != std::string::npos) {
            out_error +=
                " (usage=" + std::to_string(memory_quota_state_.bytes_in_use) +
                "/" + std::to_string(memory_quota_state_.limit_bytes) + ")";
        }
        return false;
    }

    DetectHandlers();
    out_error.clear();
    return true;
}

void LuaJitScriptHost::DetectHandlers() {
    has_tick_handler_ = false;
    has_event_handler_ = false;
    if (environment_ref_ == LUA_NOREF || environment_ref_ == LUA_REFNIL) {
        return;
    }

    lua_rawgeti(lua_state_, LUA_REGISTRYINDEX, environment_ref_);
    lua_getfield(lua_state_, -1, kTickHandlerName);
    has_tick_handler_ = lua_isfunction(lua_state_, -1);
    lua_pop(lua_state_, 1);

    lua_getfield(lua_state_, -1, kEventHandlerName);
    has_event_handler_ = lua_isfunction(lua_state_, -1);
    lua_pop(lua_state_, 2);
}

void LuaJitScriptHost::ReleaseRulesEnvironment() {
    if (lua_state_ != nullptr && environment_ref_ != LUA_NOREF &&
        environment_ref_ != LUA_REFNIL) {
        luaL_unref(lua_state_, LUA_REGISTRYINDEX, environment_ref_);
    }

    environment_ref_ = LUA_NOREF;
    has_tick_handler_ = false;
    has_event_handler_ = false;
}

bool LuaJitScriptHost::InvokeTickHandler(
    const core::TickContext& tick_context,
    std::string& out_error) {
    if (!has_tick_handler_) {
        out_error.clear();
        return true;
    }

    lua_rawgeti(lua_state_, LUA_REGISTRYINDEX, environment_ref_);
    lua_getfield(lua_state_, -1, kTickHandlerName);
    if (!lua_isfunction(lua_state_, -1)) {
        lua_pop(lua_state_, 2);
        out_error.clear();
        return true;
    }

    lua_pushnumber(lua_state_, static_cast<lua_Number>(tick_context.tick_index));
    lua_pushnumber(lua_state_, static_cast<lua_Number>(tick_context.fixed_delta_seconds));
    if (!RunProtectedLuaCall(
            lua_state_,
            static_cast<int>(kInstructionBudgetPerCall),
            2,
            out_error)) {
        lua_pop(lua_state_, 1);
        return false;
    }

    lua_pop(lua_state_, 1);
    out_error.clear();
    return true;
}

bool LuaJitScriptHost::InvokeEventHandler(
    const ScriptEvent& event_data,
    std::string& out_error) {
    if (!has_event_handler_) {
        out_error.clear();
        return true;
    }

    lua_rawgeti(lua_state_, LUA_REGISTRYINDEX, environment_ref_);
    lua_getfield(lua_state_, -1, kEventHandlerName);
    if (!lua_isfunction(lua_state_, -1)) {
        lua_pop(lua_state_, 2);
        out_error.clear();
        return true;
    }

    lua_pushlstring(lua_state_, event_data.event_name.data(), event_data.event_name.size());
    lua_pushlstring(lua_state_, event_data.payload.data(), event_data.payload.size());
    if (!RunProtectedLuaCall(
            lua_state_,
            static_cast<int>(kInstructionBudgetPerCall),
            2,
            out_error)) {
        lua_pop(lua_state_, 1);
        return false;
    }

    lua_pop(lua_state_, 1);
    out_error.clear();
    return true;
}

}  // namespace pitchsync::script

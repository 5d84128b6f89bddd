#include "script/lua_jit_script_host.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace {

bool Expect(bool condition, const char* message) {
    if (!condition) {
        std::cerr << "[FAIL] " << message << '\n';
        return false;
    }
    return true;
}

std::string ReadValue(const pitchsync::script::LuaJitScriptHost& host, const char* field) {
    std::string value;
    std::string error;
    if (!host.TryReadRulesValue(field, value, error)) {
        return "<" + error + ">";
    }
    return value;
}

constexpr pitchsync::core::TickContext kTick{.tick_index = 7, .fixed_delta_seconds = 1.0 / 60.0};

bool TestHandlersRun() {
    bool passed = true;
    std::string error;
    pitchsync::script::LuaJitScriptHost host;

    passed &= Expect(
        !host.SetRulesScript({.chunk_name = "empty", .source_code = ""}, error),
        "Empty rules should be refused.");

    const std::string rules =
        "ticks = 0\n"
        "events = 0\n"
        "last_tick = -1\n"
        "last_event = ''\n"
        "last_payload = ''\n"
        "api = host.api_version\n"
        "sandboxed = os == nil and io == nil and require == nil and loadstring == nil and load == nil\n"
        "function on_tick(tick, dt)\n"
        "  ticks = ticks + 1\n"
        "  last_tick = tick\n"
        "end\n"
        "function on_event(name, payload)\n"
        "  events = events + 1\n"
        "  last_event = name\n"
        "  last_payload = payload\n"
        "end\n";
    passed &= Expect(host.SetRulesScript({.chunk_name = "rules", .source_code = rules}, error), "Rules should be accepted.");
    passed &= Expect(host.Initialize(error), "Host should initialize with valid rules.");
    passed &= Expect(error.empty(), "Successful initialize should clear the error.");
    passed &= Expect(host.IsVmReady(), "VM should be ready after initialize.");

    const auto descriptor = host.RuntimeDescriptor();
    passed &= Expect(descriptor.backend_name == "luajit", "Descriptor should name the backend.");
    passed &= Expect(descriptor.sandbox_enabled, "Sandbox should be reported.");
    passed &= Expect(descriptor.rules_loaded, "Rules should be reported as loaded.");
    passed &= Expect(descriptor.has_tick_handler && descriptor.has_event_handler, "Both handlers should be detected.");

    passed &= Expect(ReadValue(host, "sandboxed") == "true", "Unsafe globals should be removed.");
    passed &= Expect(ReadValue(host, "api") == pitchsync::script::kScriptApiVersion, "Host API version should be visible.");
    passed &= Expect(
        !host.SetRulesScript({.chunk_name = "late", .source_code = "x = 1"}, error),
        "Rules cannot change after initialize.");

    host.DispatchEvent({.event_name = "goal", .payload = "tick=120 slot=0 score=1-0"});
    passed &= Expect(host.PendingEventCount() == 1, "Dispatched event should wait for the next tick.");
    passed &= Expect(ReadValue(host, "events") == "0", "Events should not run before the tick.");

    host.Tick(kTick);
    passed &= Expect(ReadValue(host, "ticks") == "1", "Tick handler should run once per tick.");
    passed &= Expect(ReadValue(host, "last_tick") == "7", "Tick handler should receive the tick index.");
    passed &= Expect(ReadValue(host, "last_event") == "goal", "Event handler should receive the name.");
    passed &= Expect(ReadValue(host, "last_payload") == "tick=120 slot=0 score=1-0", "Event handler should receive the payload.");
    passed &= Expect(host.PendingEventCount() == 0, "Tick should drain the event queue.");
    passed &= Expect(host.TotalProcessedEventCount() == 1, "Processed events should be counted.");

    std::string value;
    passed &= Expect(!host.TryReadRulesValue("missing", value, error), "Undefined value should not be readable.");
    passed &= Expect(!error.empty(), "Undefined value should be explained.");

    for (std::size_t index = 0; index <= pitchsync::script::LuaJitScriptHost::kMaxPendingEvents; ++index) {
        host.DispatchEvent({.event_name = "ball_touch", .payload = ""});
    }
    passed &= Expect(host.DroppedEventCount() == 1, "Events beyond the queue limit should be dropped.");

    host.Shutdown();
    passed &= Expect(!host.IsVmReady(), "Shutdown should close the VM.");
    host.DispatchEvent({.event_name = "goal", .payload = ""});
    passed &= Expect(host.PendingEventCount() == 0, "Events after shutdown should be ignored.");
    return passed;
}

bool TestFailuresAreContained() {
    bool passed = true;
    std::string error;

    pitchsync::script::LuaJitScriptHost broken;
    broken.SetRulesScript({.chunk_name = "broken", .source_code = "function on_tick(\n"}, error);
    passed &= Expect(!broken.Initialize(error), "Rules that do not compile should fail initialize.");
    passed &= Expect(error.find("broken") != std::string::npos, "Compile error should name the chunk.");

    pitchsync::script::LuaJitScriptHost heavy;
    heavy.SetRulesScript(
        {.chunk_name = "heavy",
         .source_code =
             "survived = 0\n"
             "function on_tick()\n"
             "  local sum = 0\n"
             "  for i = 1, 5000000 do sum = sum + i end\n"
             "end\n"
             "function on_event() survived = survived + 1 end\n"},
        error);
    passed &= Expect(heavy.Initialize(error), "Heavy rules should still load.");
    heavy.DispatchEvent({.event_name = "kickoff", .payload = ""});
    heavy.Tick(kTick);
    // Compiled traces may finish before the count hook fires.
    passed &= Expect(heavy.FailedCallCount() <= 1, "Heavy handler should fail at most once.");
    passed &= Expect(ReadValue(heavy, "survived") == "1", "Events should still run after a heavy tick handler.");
    heavy.Shutdown();

    pitchsync::script::LuaJitScriptHost failing;
    failing.SetRulesScript(
        {.chunk_name = "failing", .source_code = "function on_event(name) error('rejected ' .. name) end\n"},
        error);
    passed &= Expect(failing.Initialize(error), "Failing rules should still load.");
    failing.DispatchEvent({.event_name = "goal", .payload = ""});
    failing.DispatchEvent({.event_name = "kickoff", .payload = ""});
    failing.Tick(kTick);
    passed &= Expect(failing.FailedCallCount() == 2, "Every failing event call should be counted.");
    passed &= Expect(failing.IsVmReady(), "Handler errors should not tear down the VM.");
    failing.Shutdown();

    pitchsync::script::LuaJitScriptHost bare;
    passed &= Expect(bare.Initialize(error), "Host should initialize without rules.");
    passed &= Expect(!bare.RuntimeDescriptor().rules_loaded, "Bare host should report no rules.");
    bare.DispatchEvent({.event_name = "goal", .payload = ""});
    bare.Tick(kTick);
    passed &= Expect(bare.FailedCallCount() == 0, "Bare host should accept ticks and events.");
    bare.Shutdown();
    return passed;
}

bool TestShippedRules() {
    bool passed = true;
    std::string error;

    pitchsync::script::ScriptSource source;
    passed &= Expect(
        !pitchsync::script::LoadScriptSourceFile("does/not/exist.lua", source, error),
        "Missing script file should fail to load.");

    const std::filesystem::path empty_path =
        std::filesystem::temp_directory_path() / "pitchsync_empty_rules.lua";
    {
        std::ofstream empty_file(empty_path, std::ios::trunc);
    }
    passed &= Expect(
        !pitchsync::script::LoadScriptSourceFile(empty_path, source, error),
        "Empty script file should fail to load.");
    std::filesystem::remove(empty_path);

    const std::filesystem::path rules_path =
        std::filesystem::path(PITCHSYNC_SOURCE_DIR) / "scripts" / "match_rules.lua";
    passed &= Expect(pitchsync::script::LoadScriptSourceFile(rules_path, source, error), "Shipped rules should load.");
    passed &= Expect(source.chunk_name == "match_rules.lua", "Chunk should be named after the file.");

    pitchsync::script::LuaJitScriptHost host;
    host.SetRulesScript(source, error);
    passed &= Expect(host.Initialize(error), "Shipped rules should run in the sandbox.");
    host.DispatchEvent({.event_name = "ball_touch", .payload = "tick=10 slot=0 score=0-0"});
    host.DispatchEvent({.event_name = "goal", .payload = "tick=11 slot=0 score=1-0"});
    host.DispatchEvent({.event_name = "car_jump", .payload = "tick=12 slot=1"});
    host.Tick(kTick);
    passed &= Expect(ReadValue(host, "goals") == "1", "Goal should be counted.");
    passed &= Expect(ReadValue(host, "touches") == "1", "Touch should be counted.");
    passed &= Expect(ReadValue(host, "jumps") == "1", "Jump should be counted.");
    passed &= Expect(ReadValue(host, "last_event") == "car_jump", "Last event should be tracked.");

    host.DispatchEvent({.event_name = "kickoff", .payload = "tick=13 slot=0 score=1-0"});
    host.Tick(kTick);
    passed &= Expect(ReadValue(host, "touches") == "0", "Kickoff should reset touches.");
    passed &= Expect(host.FailedCallCount() == 0, "Shipped rules should not fail.");
    host.Shutdown();
    return passed;
}

}  // namespace

int main() {
    bool passed = true;
    passed &= TestHandlersRun();
    passed &= TestFailuresAreContained();
    passed &= TestShippedRules();

    if (!passed) {
        return 1;
    }

    std::cout << "[PASS] pitchsync_lua_jit_script_host_tests\n";
    return 0;
}

/**
 * @file test_runtime_adapters.cpp
 * @brief Unit tests for the runtime adapters: command lines, glue programs and error mapping
 *
 * The real runtimes are not required: executables are replaced by small shell scripts that
 * echo what they were given.
 *
 * @author WASI conformance contributors
 * @date 2026
 * @copyright MIT License
 */

// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 WASI conformance contributors

#include <catch2/catch.hpp>

#include "wasi_conformance/adapter_registry.hpp"
#include "wasi_conformance/errors.hpp"
#include "wasi_conformance/glue_adapters.hpp"
#include "wasi_conformance/native_adapters.hpp"
#include "wasi_conformance/wasmedge_adapter.hpp"

#include "test_support.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

using namespace wasi::conformance;
using namespace wasi::conformance::adapters;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

using Argv = std::vector<std::string>;

InvocationDescriptor data_invocation() {
    InvocationDescriptor invocation;
    invocation.artifact = "/build/integration/readdir.wasm";
    invocation.args = {"a", "b c"};
    invocation.env = {{"HOME", "/home"}};
    invocation.preopens = {{"/data", "/tmp/fixtures"}};
    return invocation;
}

const ProcessLauncher& launcher_with_deadline() {
    static const ProcessLauncher launcher{ProcessLauncher::Config{.timeout = 10s}};
    return launcher;
}

constexpr const char* kEchoArgs = "printf '%s\\n' \"$@\"\n";

}  // namespace

TEST_CASE("Wasmer command line", "[adapters][wasmer]") {
    const WasmerAdapter wasmer{WasmerAdapter::Config{}};
    REQUIRE(wasmer.name() == "wasmer");
    REQUIRE(wasmer.command_line(data_invocation(), "/work") ==
            Argv{"wasmer", "run", "/build/integration/readdir.wasm", "--env", "HOME=/home",
                 "--mapdir", "/data:/tmp/fixtures", "--", "a", "b c"});
}

TEST_CASE("Wasmtime command line", "[adapters][wasmtime]") {
    const WasmtimeAdapter wasmtime{WasmtimeAdapter::Config{.executable = "/opt/wasmtime"}};
    REQUIRE(wasmtime.name() == "wasmtime");
    REQUIRE(wasmtime.command_line(data_invocation(), "/work") ==
            Argv{"/opt/wasmtime", "run", "--env", "HOME=/home", "--mapdir", "/data::/tmp/fixtures",
                 "/build/integration/readdir.wasm", "--", "a", "b c"});
}

TEST_CASE("Native runtimes omit the argument separator without arguments", "[adapters]") {
    InvocationDescriptor invocation;
    invocation.artifact = "/a/clock.wasm";

    REQUIRE(WasmerAdapter{WasmerAdapter::Config{}}.command_line(invocation, "/w") == Argv{"wasmer", "run", "/a/clock.wasm"});
    REQUIRE(WasmtimeAdapter{WasmtimeAdapter::Config{}}.command_line(invocation, "/w") ==
            Argv{"wasmtime", "run", "/a/clock.wasm"});
}

TEST_CASE("Same preopens map the same host directory on every native runtime", "[adapters][preopens]") {
    const auto invocation = data_invocation();
    const WasmerAdapter wasmer{WasmerAdapter::Config{}};
    const WasmtimeAdapter wasmtime{WasmtimeAdapter::Config{}};
    const WasmEdgeAdapter wasmedge{WasmEdgeAdapter::Config{}};

    auto mapping_after = [](const Argv& cmd, const std::string& flag) {
        for (std::size_t i = 0; i + 1 < cmd.size(); ++i) {
            if (cmd[i] == flag) {
                return cmd[i + 1];
            }
        }
        return std::string{};
    };

    REQUIRE(mapping_after(wasmer.command_line(invocation, "/w"), "--mapdir") == "/data:/tmp/fixtures");
    REQUIRE(mapping_after(wasmtime.command_line(invocation, "/w"), "--mapdir") == "/data::/tmp/fixtures");
    REQUIRE(mapping_after(wasmedge.command_line(invocation, "/w"), "--dir") == "/data:/tmp/fixtures");
    REQUIRE(GlueScriptAdapter::config_json(invocation).find("\"preopens\":{\"/data\":\"/tmp/fixtures\"}") !=
            std::string::npos);
}

TEST_CASE("WasmEdge compiles ahead of time into the working directory", "[adapters][wasmedge]") {
    const WasmEdgeAdapter wasmedge{WasmEdgeAdapter::Config{}};
    const auto invocation = data_invocation();

    REQUIRE(wasmedge.object_path(invocation, "/work") == fs::path{"/work/readdir.so"});
    REQUIRE(wasmedge.compile_command(invocation, "/work") ==
            Argv{"wasmedgec", "/build/integration/readdir.wasm", "/work/readdir.so"});
    REQUIRE(wasmedge.command_line(invocation, "/work") ==
            Argv{"wasmedge", "--env", "HOME=/home", "--dir", "/data:/tmp/fixtures", "/work/readdir.so", "a", "b c"});
}

TEST_CASE("Glue adapters pass only args, env and preopens to the glue program", "[adapters][glue]") {
    const auto invocation = data_invocation();
    REQUIRE(GlueScriptAdapter::config_json(invocation) ==
            R"({"args":["a","b c"],"env":{"HOME":"/home"},"preopens":{"/data":"/tmp/fixtures"}})");

    const DenoAdapter deno{DenoAdapter::Config{}};
    REQUIRE(deno.name() == "deno");
    REQUIRE(std::string{deno.glue_filename()} == ".deno.ts");
    REQUIRE(deno.command_line(invocation, "/work/.deno.ts") ==
            Argv{"deno", "run", "--quiet", "--allow-all", "--unstable", "/work/.deno.ts",
                 GlueScriptAdapter::config_json(invocation), "/build/integration/readdir.wasm"});

    const NodeAdapter node{NodeAdapter::Config{.executable = "node18"}};
    REQUIRE(node.name() == "node");
    REQUIRE(std::string{node.glue_filename()} == ".node.js");
    REQUIRE(node.command_line(invocation, "/work/.node.js") ==
            Argv{"node18", "--no-warnings", "--experimental-wasi-unstable-preview1", "--experimental-wasm-bigint",
                 "/work/.node.js", GlueScriptAdapter::config_json(invocation), "/build/integration/readdir.wasm"});
}

TEST_CASE("Glue programs name the artifact as argv[0]", "[adapters][glue]") {
    const DenoAdapter deno{DenoAdapter::Config{.wasi_module = "file:///opt/std/wasi/snapshot_preview1.ts"}};
    const auto deno_glue = deno.glue_source();
    REQUIRE(deno_glue.rfind("import Context from \"file:///opt/std/wasi/snapshot_preview1.ts\";", 0) == 0);
    REQUIRE(deno_glue.find("args: [Deno.args[1], ...config.args]") != std::string::npos);

    const NodeAdapter node{NodeAdapter::Config{}};
    const auto node_glue = node.glue_source();
    REQUIRE(node_glue.find("require(\"wasi\")") != std::string::npos);
    REQUIRE(node_glue.find("args: [process.argv[3], ...config.args]") != std::string::npos);
    REQUIRE(node_glue.find("process.exitCode") != std::string::npos);
}

TEST_CASE("Native adapter runs the runtime in the case directory", "[adapters][execute]") {
    testing::TempDir dir;
    const auto stub = testing::write_script(dir / "bin" / "wasmer", std::string{"pwd -P\n"} + kEchoArgs);
    fs::create_directories(dir / "case");

    WasmerAdapter wasmer{WasmerAdapter::Config{.executable = stub.string()}};
    const auto result = wasmer.execute(data_invocation(), dir / "case", launcher_with_deadline());

    REQUIRE(result.exit_code == 0);
    REQUIRE_FALSE(result.timed_out);
    REQUIRE(result.stdout_bytes == (dir / "case").string() +
                                       "\nrun\n/build/integration/readdir.wasm\n--env\nHOME=/home\n"
                                       "--mapdir\n/data:/tmp/fixtures\n--\na\nb c\n");
}

TEST_CASE("Native adapter forwards stdin and guest exit status", "[adapters][execute]") {
    testing::TempDir dir;
    const auto stub = testing::write_script(dir / "wasmtime", "cat\nprintf 'err' >&2\nexit 3\n");

    auto invocation = data_invocation();
    invocation.stdin_data = "from stdin";

    WasmtimeAdapter wasmtime{WasmtimeAdapter::Config{.executable = stub.string()}};
    const auto result = wasmtime.execute(invocation, dir.path(), launcher_with_deadline());
    REQUIRE(result.stdout_bytes == "from stdin");
    REQUIRE(result.stderr_bytes == "err");
    REQUIRE(result.exit_code == 3);
}

TEST_CASE("Adapter errors are classified", "[adapters][errors]") {
    testing::TempDir dir;

    SECTION("runtime not installed") {
        WasmerAdapter wasmer{WasmerAdapter::Config{.executable = (dir / "missing").string()}};
        REQUIRE_THROWS_AS(wasmer.execute(data_invocation(), dir.path(), launcher_with_deadline()), AdapterLaunchError);
    }

    SECTION("runtime killed by a signal the harness did not send") {
        const auto stub = testing::write_script(dir / "wasmer", "kill -KILL $$\n");
        WasmerAdapter wasmer{WasmerAdapter::Config{.executable = stub.string()}};
        REQUIRE_THROWS_AS(wasmer.execute(data_invocation(), dir.path(), launcher_with_deadline()), AdapterRuntimeError);
    }

    SECTION("a run past the deadline is a result, not an error") {
        const auto stub = testing::write_script(dir / "wasmer", "sleep 5\n");
        WasmerAdapter wasmer{WasmerAdapter::Config{.executable = stub.string()}};
        const ProcessLauncher short_deadline{ProcessLauncher::Config{.timeout = 200ms}};
        const auto result = wasmer.execute(data_invocation(), dir.path(), short_deadline);
        REQUIRE(result.timed_out);
    }
}

TEST_CASE("WasmEdge execute compiles then runs the object", "[adapters][wasmedge][execute]") {
    testing::TempDir dir;
    const auto runtime = testing::write_script(dir / "bin" / "wasmedge", kEchoArgs);
    fs::create_directories(dir / "case");

    SECTION("successful compile") {
        const auto compiler = testing::write_script(dir / "bin" / "wasmedgec", "printf 'object' > \"$2\"\n");
        WasmEdgeAdapter wasmedge{WasmEdgeAdapter::Config{.executable = runtime.string(), .compiler = compiler.string()}};

        const auto result = wasmedge.execute(data_invocation(), dir / "case", launcher_with_deadline());
        REQUIRE(testing::read_file(dir / "case" / "readdir.so") == "object");
        REQUIRE(result.stdout_bytes == "--env\nHOME=/home\n--dir\n/data:/tmp/fixtures\n" +
                                           (dir / "case" / "readdir.so").string() + "\na\nb c\n");
    }

    SECTION("failing compile") {
        const auto compiler = testing::write_script(dir / "bin" / "wasmedgec", "printf 'bad magic' >&2\nexit 1\n");
        WasmEdgeAdapter wasmedge{WasmEdgeAdapter::Config{.executable = runtime.string(), .compiler = compiler.string()}};
        try {
            (void)wasmedge.execute(data_invocation(), dir / "case", launcher_with_deadline());
            FAIL("expected AdapterCompileError");
        } catch (const AdapterCompileError& ex) {
            REQUIRE(std::string{ex.what()}.find("bad magic") != std::string::npos);
            REQUIRE(std::string{ex.kind()} == "AdapterCompileError");
        }
    }

    SECTION("compile past the deadline") {
        const auto compiler = testing::write_script(dir / "bin" / "wasmedgec", "sleep 5\n");
        WasmEdgeAdapter wasmedge{WasmEdgeAdapter::Config{.executable = runtime.string(), .compiler = compiler.string()}};
        const ProcessLauncher short_deadline{ProcessLauncher::Config{.timeout = 200ms}};
        REQUIRE_THROWS_AS(wasmedge.execute(data_invocation(), dir / "case", short_deadline), AdapterTimeout);
    }
}

TEST_CASE("WasmEdge compile and run share one cell deadline", "[adapters][wasmedge][timeout]") {
    testing::TempDir dir;
    const auto compiler = testing::write_script(dir / "bin" / "wasmedgec", "sleep 0.6\nprintf 'object' > \"$2\"\n");
    const auto runtime = testing::write_script(dir / "bin" / "wasmedge", "sleep 0.6\n");
    fs::create_directories(dir / "case");

    WasmEdgeAdapter wasmedge{WasmEdgeAdapter::Config{.executable = runtime.string(), .compiler = compiler.string()}};
    const auto started = std::chrono::steady_clock::now();
    const ProcessLauncher cell{ProcessLauncher::Config{.timeout = 1000ms, .deadline = started + 1000ms}};

    const auto result = wasmedge.execute(data_invocation(), dir / "case", cell);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(result.timed_out);
    REQUIRE(elapsed < 1500ms);
}

TEST_CASE("Glue adapter writes its program and hands over the config", "[adapters][glue][execute]") {
    testing::TempDir dir;
    const auto stub = testing::write_script(dir / "node", "printf '%s' \"$5\"\n");

    NodeAdapter node{NodeAdapter::Config{.executable = stub.string()}};
    const auto invocation = data_invocation();
    const auto result = node.execute(invocation, dir.path(), launcher_with_deadline());

    REQUIRE(result.stdout_bytes == GlueScriptAdapter::config_json(invocation));
    REQUIRE(testing::read_file(dir / ".node.js") == node.glue_source());
}

TEST_CASE("Registry builds adapters in declared order", "[adapters][registry]") {
    REQUIRE(adapter_names() == Argv{"deno", "node", "wasmer", "wasmtime", "wasmedge"});

    auto names_of = [](const AdapterList& list) {
        Argv names;
        for (const auto& adapter : list) {
            names.push_back(adapter->name());
        }
        return names;
    };

    REQUIRE(names_of(make_adapters()) == adapter_names());
    REQUIRE(names_of(make_adapters({"wasmedge", "deno"})) == Argv{"deno", "wasmedge"});
    REQUIRE(make_adapters({"wasmtime"}, {{"wasmtime", "/opt/wasmtime"}, {"wasmedgec", "/opt/wasmedgec"}}).size() == 1);

    REQUIRE_THROWS_AS(make_adapters({"wasm3"}), std::invalid_argument);
    REQUIRE_THROWS_AS(make_adapters({}, {{"wasm3", "/bin/wasm3"}}), std::invalid_argument);
}

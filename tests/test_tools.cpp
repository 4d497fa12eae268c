#include "test_framework.hpp"

#include "opgate/common/json_util.hpp"
#include "opgate/tools/tool_registry.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <memory>

namespace {

namespace op = opgate::operation;
namespace tools = opgate::tools;

struct ToolFixture {
  opgate::testing::TempWorkspace ws;
  std::shared_ptr<op::MemoryAllowlistStore> store = std::make_shared<op::MemoryAllowlistStore>();
  std::shared_ptr<op::OperationHandler> handler;
  tools::ToolRegistry registry;

  ToolFixture() {
    (void)store->save("opgate:operation", "ALLOWED_DIRECTORIES=" + ws.path().string() + "\n");
    handler = op::OperationHandler::create(opgate::testing::mock_config(), store);
    registry = tools::ToolRegistry::create_operation(handler);
  }

  opgate::common::Result<tools::ToolResult> call(const std::string &name,
                                                 const tools::ToolArgs &args) {
    tools::ITool *tool = registry.get_tool(name);
    if (tool == nullptr) {
      throw std::runtime_error("tool not registered: " + name);
    }
    return tool->execute(args, tools::ToolContext{.session_id = "test", .conversation_id = {}});
  }
};

} // namespace

void register_tools_tests(std::vector<opgate::tests::TestCase> &tests) {
  using opgate::tests::require;
  using opgate::common::ErrorKind;

  tests.push_back({"tools_registry_exposes_operation_tools", [] {
                     ToolFixture fx;
                     const auto specs = fx.registry.all_specs();
                     require(specs.size() == 7, "seven tools");
                     require(fx.registry.get_tool("READ_FILE") != nullptr, "case-insensitive");
                     require(fx.registry.get_tool("web_fetch") == nullptr, "unknown tool");

                     for (const auto &spec : specs) {
                       require(!spec.description.empty(), spec.name + " has a description");
                       require(opgate::common::json_get_string(spec.parameters_json, "type") ==
                                   "object",
                               spec.name + " schema is an object");
                     }
                     require(fx.registry.get_tool("read_file")->is_safe(), "read is safe");
                     require(!fx.registry.get_tool("execute_bash")->is_safe(), "bash is not");
                     require(fx.registry.get_tool("kill_bash")->group() == "runtime", "group");

                     const std::string json = tools::specs_to_json(specs);
                     require(json.front() == '[' && json.back() == ']', "array");
                     require(json.find("\"name\":\"list_directory\"") != std::string::npos, json);
                   }});

  tests.push_back({"tools_file_round_trip", [] {
                     ToolFixture fx;
                     const std::string path = fx.ws.file("notes/todo.txt");
                     auto written = fx.call("write_file", {{"file_path", path}, {"content", "a\nb\n"}});
                     require(written.ok() && written.value().success, written.value().output);
                     require(opgate::common::json_get_scalar(written.value().output, "created") ==
                                 "true",
                             written.value().output);

                     auto edited = fx.call("edit_file", {{"file_path", path},
                                                         {"old_string", "b"},
                                                         {"new_string", ""},
                                                         {"replace_all", "true"}});
                     require(edited.ok() && edited.value().success, edited.value().output);

                     auto read = fx.call("read_file", {{"file_path", path}, {"offset", "1"}});
                     require(read.ok() && read.value().success, read.value().output);
                     require(opgate::common::json_get_string(read.value().output, "content") ==
                                 "     1\ta\n     2\t\n",
                             read.value().output);

                     auto listed = fx.call("list_directory",
                                           {{"path", fx.ws.path().string()}, {"recursive", "true"}});
                     require(listed.ok() && listed.value().success, listed.value().output);
                     require(listed.value().output.find("todo.txt") != std::string::npos,
                             listed.value().output);
                   }});

  tests.push_back({"tools_report_argument_and_operation_errors", [] {
                     ToolFixture fx;
                     auto missing_arg = fx.call("read_file", {});
                     require(!missing_arg.ok() && missing_arg.kind() == ErrorKind::Validation,
                             "missing argument fails the call");

                     auto bad_int = fx.call("read_file", {{"file_path", "/x"}, {"limit", "ten"}});
                     require(!bad_int.ok() && bad_int.kind() == ErrorKind::Validation, "bad int");

                     auto bad_bool = fx.call("list_directory", {{"path", "/"}, {"recursive", "yes"}});
                     require(!bad_bool.ok(), "bad bool");

                     auto missing_file = fx.call("read_file", {{"file_path", fx.ws.file("nope")}});
                     require(missing_file.ok(), "operation errors are tool results");
                     require(!missing_file.value().success, "unsuccessful result");
                     require(missing_file.value().metadata.at("error_kind") == "not_found",
                             "error kind in metadata");
                   }});

  tests.push_back({"tools_bash_lifecycle", [] {
                     ToolFixture fx;
                     auto fg = fx.call("execute_bash", {{"command", "echo hi"}, {"timeout", "5000"}});
                     require(fg.ok() && fg.value().success, fg.value().output);
                     require(fg.value().metadata.at("exit_code") == "0", "exit code metadata");
                     require(opgate::common::json_get_string(fg.value().output, "output") == "hi\n",
                             fg.value().output);

                     auto zero = fx.call("execute_bash", {{"command", "echo"}, {"timeout", "0"}});
                     require(!zero.ok() && zero.kind() == ErrorKind::Validation, "zero timeout");

                     auto bg = fx.call("execute_bash",
                                       {{"command", "sleep 30"}, {"run_in_background", "true"}});
                     require(bg.ok() && bg.value().success, bg.value().output);
                     const std::string id =
                         opgate::common::json_get_string(bg.value().output, "bash_id");
                     require(!id.empty(), "bash id returned");

                     auto polled = fx.call("get_bash_output", {{"bash_id", id}});
                     require(polled.ok() && polled.value().success, polled.value().output);
                     require(opgate::common::json_get_string(polled.value().output, "status") ==
                                 "running",
                             polled.value().output);

                     auto killed = fx.call("kill_bash", {{"bash_id", id}});
                     require(killed.ok() && killed.value().success, killed.value().output);
                     require(opgate::common::json_get_scalar(killed.value().output, "was_running") ==
                                 "true",
                             killed.value().output);

                     auto gone = fx.call("get_bash_output", {{"bash_id", id}});
                     require(gone.ok() && !gone.value().success, "unknown id after kill");
                   }});
}

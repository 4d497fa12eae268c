#include "opgate/cli/bridge.hpp"

#include "opgate/common/fs.hpp"
#include "opgate/common/json_util.hpp"
#include "opgate/observability/global.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <istream>
#include <iterator>
#include <optional>
#include <ostream>
#include <system_error>

namespace opgate::cli {

namespace {

std::optional<std::int64_t> parse_conversation_id(const std::string &raw) {
  const std::string value = common::trim(raw);
  if (value.empty() || value == "null") {
    return std::nullopt;
  }
  std::int64_t parsed = 0;
  const auto *first = value.data();
  const auto *last = first + value.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

std::string error_line(const std::string &message) {
  common::JsonObjectWriter writer;
  writer.add("type", "error").add("message", message);
  return writer.str();
}

} // namespace

StdioBridge::StdioBridge(std::shared_ptr<operation::OperationHandler> handler, std::ostream &out)
    : handler_(std::move(handler)), registry_(tools::ToolRegistry::create_operation(handler_)),
      out_(out) {
  handler_->permissions()->set_event_sink(approval_sink());
}

StdioBridge::~StdioBridge() {
  shutdown();
  handler_->permissions()->set_event_sink({});
}

operation::ApprovalEventSink StdioBridge::approval_sink() {
  return [this](const operation::PermissionRequestEvent &event) {
    if (closing_.load()) {
      return common::Status::error("approval channel closed");
    }
    common::JsonObjectWriter writer;
    writer.add("type", "approval_request")
        .add("request_id", event.request_id)
        .add("operation", event.operation)
        .add("path", event.path)
        .add_optional("conversation_id", event.conversation_id);
    emit(writer.str());
    return common::Status::success();
  };
}

void StdioBridge::run(std::istream &in) {
  std::string line;
  while (std::getline(in, line)) {
    if (common::trim(line).empty()) {
      continue;
    }
    handle_line(line);
  }
  shutdown();
}

void StdioBridge::handle_line(const std::string &line) {
  const auto message = common::json_parse_flat(line);
  const auto type_it = message.find("type");
  if (type_it == message.end()) {
    emit(error_line("message has no type"));
    return;
  }

  const auto field = [&message](const std::string &key) {
    const auto it = message.find(key);
    return it == message.end() ? std::string() : it->second;
  };

  if (type_it->second == "call") {
    dispatch_call(field("id"), field("tool"), field("args"), field("conversation_id"));
    return;
  }
  if (type_it->second == "confirm") {
    handle_confirm(field("request_id"), field("decision"));
    return;
  }
  emit(error_line("unknown message type: " + type_it->second));
}

void StdioBridge::dispatch_call(const std::string &id, const std::string &tool,
                                const std::string &args_json,
                                const std::string &conversation_id) {
  tools::ToolContext ctx;
  ctx.session_id = "stdio";
  ctx.conversation_id = parse_conversation_id(conversation_id);
  tools::ToolArgs args = common::json_parse_flat(args_json.empty() ? "{}" : args_json);

  reap_workers();

  auto done = std::make_shared<std::atomic<bool>>(false);
  std::lock_guard<std::mutex> lock(workers_mutex_);
  try {
    std::thread thread([this, id, tool, args = std::move(args), ctx = std::move(ctx), done] {
      run_call(id, tool, args, ctx);
      done->store(true);
    });
    workers_.push_back(Worker{.thread = std::move(thread), .done = std::move(done)});
  } catch (const std::system_error &err) {
    observability::record_error("bridge", "cannot start call " + id + ": " + err.what());
    common::JsonObjectWriter writer;
    writer.add("type", "result")
        .add("id", id)
        .add("success", false)
        .add("output", std::string("Failed to start call: ") + err.what())
        .add("error_kind", std::string(common::error_kind_to_string(common::ErrorKind::Io)));
    emit(writer.str());
  }
}

void StdioBridge::run_call(const std::string &id, const std::string &tool,
                           const tools::ToolArgs &args, const tools::ToolContext &ctx) {
  common::JsonObjectWriter writer;
  writer.add("type", "result").add("id", id);

  tools::ITool *target = registry_.get_tool(tool);
  if (target == nullptr) {
    writer.add("success", false).add("output", "Unknown tool: " + tool);
    emit(writer.str());
    return;
  }

  auto result = target->execute(args, ctx);
  if (!result.ok()) {
    writer.add("success", false)
        .add("output", result.error())
        .add("error_kind", std::string(common::error_kind_to_string(result.kind())));
  } else {
    writer.add("success", result.value().success).add("output", result.value().output);
    const auto kind = result.value().metadata.find("error_kind");
    if (kind != result.value().metadata.end()) {
      writer.add("error_kind", kind->second);
    }
  }
  emit(writer.str());
}

std::size_t StdioBridge::reap_workers() {
  std::vector<Worker> finished;
  std::size_t running = 0;
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    auto split = std::partition(workers_.begin(), workers_.end(),
                                [](const Worker &worker) { return !worker.done->load(); });
    std::move(split, workers_.end(), std::back_inserter(finished));
    workers_.erase(split, workers_.end());
    running = workers_.size();
  }
  for (auto &worker : finished) {
    if (worker.thread.joinable()) {
      worker.thread.join();
    }
  }
  return running;
}

void StdioBridge::handle_confirm(const std::string &request_id, const std::string &decision) {
  const auto status = handler_->confirm_permission(request_id, decision);
  common::JsonObjectWriter writer;
  writer.add("type", "confirm_result").add("request_id", request_id).add("success", status.ok());
  if (!status.ok()) {
    writer.add("error", status.error());
  }
  emit(writer.str());
}

void StdioBridge::shutdown() {
  closing_.store(true);
  handler_->state()->cancel_pending_approvals();

  std::vector<Worker> workers;
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    workers.swap(workers_);
  }
  for (auto &worker : workers) {
    if (worker.thread.joinable()) {
      worker.thread.join();
    }
  }
}

void StdioBridge::emit(const std::string &line) {
  std::lock_guard<std::mutex> lock(out_mutex_);
  out_ << line << '\n';
  out_.flush();
}

} // namespace opgate::cli

#include "test_framework.hpp"

#include "opgate/common/kv_text.hpp"
#include "opgate/observability/global.hpp"
#include "opgate/operation/allowlist_store.hpp"
#include "opgate/operation/file_ops.hpp"
#include "opgate/operation/permission.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <thread>
#include <variant>

namespace {

namespace op = opgate::operation;

struct PermissionFixture {
  std::shared_ptr<op::OperationState> state = std::make_shared<op::OperationState>();
  std::shared_ptr<op::MemoryAllowlistStore> store = std::make_shared<op::MemoryAllowlistStore>();
  std::shared_ptr<op::PermissionManager> permissions =
      std::make_shared<op::PermissionManager>(state, store, "opgate:operation");

  void seed(const std::string &blob) {
    if (!store->save("opgate:operation", blob).ok()) {
      throw std::runtime_error("seeding the allow-list failed");
    }
  }

  // Answers every prompt with `decision` and counts prompts.
  std::shared_ptr<std::atomic<int>> answer_with(op::PermissionDecision decision) {
    auto prompts = std::make_shared<std::atomic<int>>(0);
    permissions->set_event_sink([this, decision, prompts](const op::PermissionRequestEvent &event) {
      ++*prompts;
      (void)state->resolve_pending_approval(event.request_id, decision);
      return opgate::common::Status::success();
    });
    return prompts;
  }
};

// Serves a fixed blob until told to fail; refuses every save.
class UnreliableStore final : public op::IAllowlistStore {
public:
  explicit UnreliableStore(std::string blob) : blob_(std::move(blob)) {}

  [[nodiscard]] std::string_view name() const override { return "unreliable"; }

  [[nodiscard]] opgate::common::Result<std::string> load(const std::string &) override {
    if (fail_load) {
      return opgate::common::Result<std::string>::failure("database is locked");
    }
    return opgate::common::Result<std::string>::success(blob_);
  }

  [[nodiscard]] opgate::common::Status save(const std::string &, const std::string &) override {
    return opgate::common::Status::error("read-only filesystem");
  }

  std::atomic<bool> fail_load{false};

private:
  std::string blob_;
};

std::vector<opgate::observability::WarningEvent>
warnings(const opgate::testing::CapturingObserver &observer) {
  std::vector<opgate::observability::WarningEvent> out;
  for (const auto &event : observer.events()) {
    if (const auto *warning = std::get_if<opgate::observability::WarningEvent>(&event)) {
      out.push_back(*warning);
    }
  }
  return out;
}

} // namespace

void register_permission_tests(std::vector<opgate::tests::TestCase> &tests) {
  using opgate::tests::require;
  using opgate::common::ErrorKind;

  tests.push_back({"permission_empty_allowlist_allows_nothing", [] {
                     PermissionFixture fx;
                     require(fx.permissions->load_allowlist().empty(), "empty list");
                     require(!fx.permissions->is_path_allowed("/"), "root not allowed");
                     require(!fx.permissions->is_path_allowed("/tmp/file.txt"), "file not allowed");
                   }});

  tests.push_back({"permission_allowlist_matches_whole_components", [] {
                     opgate::testing::TempWorkspace ws;
                     PermissionFixture fx;
                     const auto project = (ws.path() / "project").string();
                     fx.seed("ALLOWED_DIRECTORIES=" + project + "/\n  \n");

                     require(fx.permissions->load_allowlist().size() == 1, "one entry");
                     require(fx.permissions->is_path_allowed(project), "the directory itself");
                     require(fx.permissions->is_path_allowed(project + "/src/new/file.txt"),
                             "nested path that does not exist yet");
                     require(!fx.permissions->is_path_allowed(project + "x/file.txt"),
                             "sibling sharing a prefix");
                     require(!fx.permissions->is_path_allowed(project + "/../escape.txt"),
                             "dot-dot escapes the directory");
                   }});

  tests.push_back({"permission_deny_leaves_disk_untouched", [] {
                     opgate::testing::TempWorkspace ws;
                     PermissionFixture fx;
                     fx.seed("ALLOWED_DIRECTORIES=" + (ws.path() / "project").string() + "\n");
                     const auto prompts = fx.answer_with(op::PermissionDecision::Deny);
                     op::FileOperations files(fx.state, fx.permissions, {});

                     const auto target = ws.path() / "outside" / "notes.txt";
                     const auto result = files.write_file(
                         op::WriteFileRequest{.file_path = target.string(), .content = "x"}, {});
                     require(!result.ok(), "write should be rejected");
                     require(result.kind() == ErrorKind::PermissionDenied, "permission denied");
                     require(result.error() == "Permission denied by user", result.error());
                     require(prompts->load() == 1, "exactly one prompt");
                     require(!std::filesystem::exists(target), "file must not exist");
                     require(!std::filesystem::exists(target.parent_path()),
                             "parent directory must not be created");
                     require(fx.state->pending_approval_count() == 0, "no leftover request");
                   }});

  tests.push_back({"permission_allow_and_save_persists_parent", [] {
                     opgate::testing::TempWorkspace ws;
                     PermissionFixture fx;
                     fx.seed("DEFAULT_SHELL=bash\nMAX_READ_LINES=40\n");
                     const auto prompts = fx.answer_with(op::PermissionDecision::AllowAndSave);
                     op::FileOperations files(fx.state, fx.permissions, {});

                     const auto proj = ws.path() / "proj";
                     auto first = files.write_file(
                         op::WriteFileRequest{.file_path = (proj / "a.txt").string(),
                                              .content = "alpha"},
                         {});
                     require(first.ok(), first.error());
                     require(first.value().created, "new file");
                     require(opgate::testing::read_text(proj / "a.txt") == "alpha", "content");

                     const auto list = fx.permissions->load_allowlist();
                     require(list.size() == 1 && list[0] == proj.string(),
                             "parent directory should be saved");
                     const auto blob = fx.store->load("opgate:operation");
                     const auto kv = opgate::common::KvText::parse(blob.value());
                     require(kv.get("DEFAULT_SHELL") == "bash", "other keys preserved");
                     require(kv.get("MAX_READ_LINES") == "40", "other keys preserved");

                     auto second = files.write_file(
                         op::WriteFileRequest{.file_path = (proj / "b.txt").string(),
                                              .content = "beta"},
                         {});
                     require(second.ok(), second.error());
                     require(prompts->load() == 1, "allow-listed path must not prompt again");
                   }});

  tests.push_back({"permission_allow_and_save_survives_store_failure", [] {
                     auto capture = std::make_shared<opgate::testing::CapturingObserver>();
                     opgate::observability::set_global_observer(capture);
                     auto state = std::make_shared<op::OperationState>();
                     auto store = std::make_shared<UnreliableStore>("");
                     op::PermissionManager permissions(state, store, "opgate:operation");
                     permissions.set_event_sink([&state](const op::PermissionRequestEvent &event) {
                       (void)state->resolve_pending_approval(event.request_id,
                                                             op::PermissionDecision::AllowAndSave);
                       return opgate::common::Status::success();
                     });

                     const auto granted =
                         permissions.check_and_request("write_file", "/srv/app/new.txt", {});
                     opgate::observability::set_global_observer(nullptr);

                     require(granted.ok() && granted.value(), "grant kept when saving fails");
                     require(permissions.load_allowlist().empty(), "nothing was persisted");
                     const auto logged = warnings(*capture);
                     require(logged.size() == 1, "one warning");
                     require(logged[0].component == "permission" &&
                                 logged[0].message.find("read-only filesystem") != std::string::npos,
                             logged[0].message);
                   }});

  tests.push_back({"permission_unreadable_allowlist_fails_closed", [] {
                     opgate::testing::TempWorkspace ws;
                     auto capture = std::make_shared<opgate::testing::CapturingObserver>();
                     opgate::observability::set_global_observer(capture);
                     auto state = std::make_shared<op::OperationState>();
                     auto store = std::make_shared<UnreliableStore>("ALLOWED_DIRECTORIES=" +
                                                                    ws.path().string() + "\n");
                     op::PermissionManager permissions(state, store, "opgate:operation");
                     const std::string target = ws.file("notes.txt");

                     const bool allowed_before = permissions.is_path_allowed(target);
                     store->fail_load = true;
                     const bool allowed_after = permissions.is_path_allowed(target);
                     const auto listed = permissions.load_allowlist();
                     opgate::observability::set_global_observer(nullptr);

                     require(allowed_before, "readable allow-list grants the path");
                     require(!allowed_after, "load failure denies instead of allowing");
                     require(listed.empty(), "load failure yields an empty list");
                     const auto logged = warnings(*capture);
                     require(!logged.empty() &&
                                 logged[0].message.find("database is locked") != std::string::npos,
                             "load failure is logged");
                   }});

  tests.push_back({"permission_unread_overwrite_never_prompts", [] {
                     opgate::testing::TempWorkspace ws;
                     ws.create_file("report.txt", "draft");
                     PermissionFixture fx;
                     const auto prompts = fx.answer_with(op::PermissionDecision::Allow);
                     op::FileOperations files(fx.state, fx.permissions, {});

                     const auto result = files.write_file(
                         op::WriteFileRequest{.file_path = ws.file("report.txt"),
                                              .content = "final"},
                         {});
                     require(!result.ok() && result.kind() == ErrorKind::Validation,
                             "read-before-write rejects the overwrite");
                     require(prompts->load() == 0, "no prompt for a write that cannot succeed");
                     require(opgate::testing::read_text(ws.path() / "report.txt") == "draft",
                             "file untouched");
                   }});

  tests.push_back({"permission_add_to_allowlist_deduplicates", [] {
                     PermissionFixture fx;
                     require(fx.permissions->add_to_allowlist("/srv/app/one.txt").ok(), "first");
                     require(fx.permissions->add_to_allowlist("/srv/app/two.txt").ok(), "second");
                     require(fx.permissions->add_allowed_directory("/srv/data").ok(), "directory");
                     const auto list = fx.permissions->load_allowlist();
                     require(list.size() == 2, "duplicates collapse");
                     require(list[0] == "/srv/app" && list[1] == "/srv/data", "order kept");
                   }});

  tests.push_back({"permission_request_without_sink_is_denied", [] {
                     PermissionFixture fx;
                     const auto result = fx.permissions->request_approval("write_file", "/tmp/x", {});
                     require(!result.ok() && result.kind() == ErrorKind::PermissionDenied,
                             "no channel means no approval");
                     require(fx.state->pending_approval_count() == 0, "nothing stored");
                   }});

  tests.push_back({"permission_sink_failure_cleans_up", [] {
                     PermissionFixture fx;
                     fx.permissions->set_event_sink([](const op::PermissionRequestEvent &) {
                       return opgate::common::Status::error("ui offline");
                     });
                     const auto result = fx.permissions->request_approval("write_file", "/tmp/x", {});
                     require(!result.ok() && result.kind() == ErrorKind::Io, "io error");
                     require(fx.state->pending_approval_count() == 0, "request discarded");
                   }});

  tests.push_back({"permission_cancel_unblocks_request", [] {
                     PermissionFixture fx;
                     std::thread canceller;
                     fx.permissions->set_event_sink(
                         [&fx, &canceller](const op::PermissionRequestEvent &) {
                           canceller = std::thread([&fx] {
                             std::this_thread::sleep_for(std::chrono::milliseconds(50));
                             fx.state->cancel_pending_approvals();
                           });
                           return opgate::common::Status::success();
                         });
                     const auto result = fx.permissions->request_approval("write_file", "/tmp/x", {});
                     canceller.join();
                     require(!result.ok(), "cancelled request fails");
                     require(result.kind() == ErrorKind::Cancelled, "cancelled kind");
                   }});

  tests.push_back({"permission_confirm_from_another_thread", [] {
                     PermissionFixture fx;
                     std::promise<op::PermissionRequestEvent> seen;
                     auto seen_future = seen.get_future();
                     fx.permissions->set_event_sink([&seen](const op::PermissionRequestEvent &event) {
                       seen.set_value(event);
                       return opgate::common::Status::success();
                     });

                     auto pending = std::async(std::launch::async, [&fx] {
                       return fx.permissions->request_approval(
                           "write_file", "/tmp/opgate/x.txt",
                           op::OperationContext{.conversation_id = 42});
                     });
                     const auto event = seen_future.get();
                     require(event.conversation_id == 42, "context forwarded");
                     require(event.operation == "write_file" && event.path == "/tmp/opgate/x.txt",
                             "event fields");
                     require(fx.permissions->confirm(event.request_id, op::PermissionDecision::Allow),
                             "first confirm");
                     require(!fx.permissions->confirm(event.request_id, op::PermissionDecision::Deny),
                             "second confirm is rejected");
                     const auto result = pending.get();
                     require(result.ok() && result.value() == op::PermissionDecision::Allow,
                             "allow delivered");
                   }});

  tests.push_back({"permission_sqlite_store_round_trips", [] {
                     opgate::testing::TempWorkspace ws;
                     const auto db = ws.path() / "state" / "opgate.db";
                     {
                       op::SqliteAllowlistStore store(db);
                       const auto empty = store.load("k");
                       require(empty.ok() && empty.value().empty(), "missing key is empty");
                       require(store.save("k", "ALLOWED_DIRECTORIES=/a\n/b\n").ok(), "save");
                       require(store.save("k", "ALLOWED_DIRECTORIES=/c\n").ok(), "overwrite");
                       require(store.save("other", "X=1\n").ok(), "second key");
                     }
                     op::SqliteAllowlistStore reopened(db);
                     const auto loaded = reopened.load("k");
                     require(loaded.ok(), loaded.error());
                     require(loaded.value() == "ALLOWED_DIRECTORIES=/c\n", loaded.value());
                     require(reopened.load("other").value() == "X=1\n", "keys are independent");
                   }});

  tests.push_back({"permission_store_factory_validates_backend", [] {
                     opgate::config::AllowlistConfig config;
                     config.backend = "memory";
                     const auto memory = op::create_allowlist_store(config);
                     require(memory.ok() && memory.value()->name() == "memory", "memory store");
                     config.backend = "etcd";
                     const auto unknown = op::create_allowlist_store(config);
                     require(!unknown.ok() && unknown.kind() == ErrorKind::Validation,
                             "unknown backend");
                   }});
}

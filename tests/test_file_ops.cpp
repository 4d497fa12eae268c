#include "test_framework.hpp"

#include "opgate/operation/file_ops.hpp"
#include "opgate/operation/glob.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <memory>

namespace {

namespace op = opgate::operation;

struct FileFixture {
  opgate::testing::TempWorkspace ws;
  std::shared_ptr<op::OperationState> state = std::make_shared<op::OperationState>();
  std::shared_ptr<op::MemoryAllowlistStore> store = std::make_shared<op::MemoryAllowlistStore>();
  std::shared_ptr<op::PermissionManager> permissions =
      std::make_shared<op::PermissionManager>(state, store, "opgate:operation");
  std::unique_ptr<op::FileOperations> files;

  explicit FileFixture(opgate::config::OperationConfig config = {}) {
    (void)store->save("opgate:operation", "ALLOWED_DIRECTORIES=" + ws.path().string() + "\n");
    files = std::make_unique<op::FileOperations>(state, permissions, config);
  }

  op::ReadFileRequest read(const std::string &name) const {
    return op::ReadFileRequest{.file_path = ws.file(name), .offset = {}, .limit = {}};
  }
};

void touch_at(const std::filesystem::path &path, const int seconds_ago) {
  std::filesystem::last_write_time(path, std::filesystem::file_time_type::clock::now() -
                                             std::chrono::seconds(seconds_ago));
}

std::vector<std::string> names(const op::ListDirectoryResponse &response) {
  std::vector<std::string> out;
  for (const auto &entry : response.entries) {
    out.push_back(entry.name);
  }
  return out;
}

} // namespace

void register_file_ops_tests(std::vector<opgate::tests::TestCase> &tests) {
  using opgate::tests::require;
  using opgate::common::ErrorKind;

  tests.push_back({"file_read_window_is_numbered", [] {
                     FileFixture fx;
                     fx.ws.create_file("five.txt", "one\ntwo\nthree\nfour\nfive\n");
                     auto request = fx.read("five.txt");
                     request.offset = 2;
                     request.limit = 2;
                     const auto result = fx.files->read_file(request);
                     require(result.ok(), result.error());
                     const auto &response = result.value();
                     require(response.content == "     2\ttwo\n     3\tthree\n", response.content);
                     require(response.start_line == 2 && response.end_line == 3, "window bounds");
                     require(response.total_lines == 5, "total lines");
                     require(response.has_more, "more lines follow");
                     require(fx.state->has_file_been_read(fx.ws.file("five.txt")), "read recorded");
                   }});

  tests.push_back({"file_read_defaults_and_past_end", [] {
                     FileFixture fx;
                     fx.ws.create_file("short.txt", "a\nb");
                     const auto all = fx.files->read_file(fx.read("short.txt"));
                     require(all.ok(), all.error());
                     require(all.value().content == "     1\ta\n     2\tb\n", all.value().content);
                     require(!all.value().has_more, "whole file");

                     auto past = fx.read("short.txt");
                     past.offset = 10;
                     const auto beyond = fx.files->read_file(past);
                     require(beyond.ok(), beyond.error());
                     require(beyond.value().content.empty(), "nothing past the end");
                     require(beyond.value().start_line == 3 && beyond.value().end_line == 2,
                             "empty window sits after the last line");

                     fx.ws.create_file("empty.txt", "");
                     const auto empty = fx.files->read_file(fx.read("empty.txt"));
                     require(empty.ok() && empty.value().total_lines == 0, "empty file");
                   }});

  tests.push_back({"file_read_respects_configured_limits", [] {
                     opgate::config::OperationConfig config;
                     config.max_read_lines = 3;
                     config.max_line_length = 10;
                     FileFixture fx(config);
                     fx.ws.create_file("long.txt", "0123456789abcdef\nx\ny\nz\n");
                     const auto result = fx.files->read_file(fx.read("long.txt"));
                     require(result.ok(), result.error());
                     require(result.value().content ==
                                 "     1\t0123456789...[truncated]\n     2\tx\n     3\ty\n",
                             result.value().content);
                     require(result.value().end_line == 3 && result.value().has_more,
                             "default limit applied");
                   }});

  tests.push_back({"file_read_rejects_bad_input", [] {
                     FileFixture fx;
                     const auto relative = fx.files->read_file(
                         op::ReadFileRequest{.file_path = "relative.txt", .offset = {}, .limit = {}});
                     require(!relative.ok() && relative.kind() == ErrorKind::Validation, "relative");

                     const auto missing = fx.files->read_file(fx.read("nope.txt"));
                     require(!missing.ok() && missing.kind() == ErrorKind::NotFound, "missing");

                     std::filesystem::create_directories(fx.ws.path() / "dir");
                     const auto dir = fx.files->read_file(fx.read("dir"));
                     require(!dir.ok() && dir.kind() == ErrorKind::Validation, "directory");

                     fx.ws.create_file("blob.bin", std::string("PK\0\x03\x04", 5));
                     const auto binary = fx.files->read_file(fx.read("blob.bin"));
                     require(!binary.ok() && binary.kind() == ErrorKind::Validation, "binary");
                     require(!fx.state->has_file_been_read(fx.ws.file("blob.bin")),
                             "failed reads are not recorded");

                     fx.ws.create_file("ok.txt", "x\n");
                     auto negative = fx.read("ok.txt");
                     negative.limit = -1;
                     const auto neg = fx.files->read_file(negative);
                     require(!neg.ok() && neg.kind() == ErrorKind::Validation, "negative limit");
                   }});

  tests.push_back({"file_write_requires_prior_read", [] {
                     FileFixture fx;
                     fx.ws.create_file("config.ini", "original");
                     const op::WriteFileRequest overwrite{.file_path = fx.ws.file("config.ini"),
                                                          .content = "replaced"};
                     const auto blocked = fx.files->write_file(overwrite, {});
                     require(!blocked.ok() && blocked.kind() == ErrorKind::Validation,
                             "unread overwrite rejected");
                     require(blocked.error().find("Safety check failed") == 0, blocked.error());
                     require(opgate::testing::read_text(fx.ws.path() / "config.ini") == "original",
                             "file untouched");

                     require(fx.files->read_file(fx.read("config.ini")).ok(), "read");
                     const auto written = fx.files->write_file(overwrite, {});
                     require(written.ok(), written.error());
                     require(!written.value().created, "existing file");
                     require(written.value().bytes_written == 8, "byte count");
                     require(opgate::testing::read_text(fx.ws.path() / "config.ini") == "replaced",
                             "new content");
                   }});

  tests.push_back({"file_write_creates_parents_and_records_read", [] {
                     FileFixture fx;
                     const auto path = fx.ws.file("a/b/c/new.txt");
                     const auto written = fx.files->write_file(
                         op::WriteFileRequest{.file_path = path, .content = "hello\n"}, {});
                     require(written.ok(), written.error());
                     require(written.value().created, "created");
                     require(fx.state->has_file_been_read(path), "write counts as read");

                     const auto edited = fx.files->edit_file(op::EditFileRequest{
                         .file_path = path, .old_string = "hello", .new_string = "bye",
                         .replace_all = false});
                     require(edited.ok(), edited.error());
                     require(opgate::testing::read_text(path) == "bye\n", "edited");

                     const auto dir = fx.files->write_file(
                         op::WriteFileRequest{.file_path = fx.ws.file("a/b"), .content = "x"}, {});
                     require(!dir.ok() && dir.kind() == ErrorKind::Validation, "directory target");
                   }});

  tests.push_back({"file_edit_validates_and_replaces", [] {
                     FileFixture fx;
                     fx.ws.create_file("code.cpp", "int x = 1;\nint y = 1;\nint z = 1;\n");
                     const auto path = fx.ws.file("code.cpp");

                     const auto same = fx.files->edit_file(op::EditFileRequest{
                         .file_path = path, .old_string = "1", .new_string = "1",
                         .replace_all = false});
                     require(!same.ok() && same.kind() == ErrorKind::Validation, "old == new");
                     require(same.error() == "old_string and new_string must be different",
                             same.error());

                     const auto unread = fx.files->edit_file(op::EditFileRequest{
                         .file_path = path, .old_string = "1", .new_string = "2",
                         .replace_all = false});
                     require(!unread.ok() && unread.kind() == ErrorKind::Validation, "unread");

                     require(fx.files->read_file(fx.read("code.cpp")).ok(), "read");
                     const auto absent = fx.files->edit_file(op::EditFileRequest{
                         .file_path = path, .old_string = "float", .new_string = "double",
                         .replace_all = false});
                     require(!absent.ok() && absent.kind() == ErrorKind::NotFound, "no match");

                     const auto first = fx.files->edit_file(op::EditFileRequest{
                         .file_path = path, .old_string = "= 1", .new_string = "= 2",
                         .replace_all = false});
                     require(first.ok() && first.value().replacements_made == 1, "first only");
                     require(opgate::testing::read_text(path) ==
                                 "int x = 2;\nint y = 1;\nint z = 1;\n",
                             "only the first occurrence changes");

                     const auto all = fx.files->edit_file(op::EditFileRequest{
                         .file_path = path, .old_string = "= 1", .new_string = "= 3",
                         .replace_all = true});
                     require(all.ok() && all.value().replacements_made == 2, "replace all");
                     require(opgate::testing::read_text(path) ==
                                 "int x = 2;\nint y = 3;\nint z = 3;\n",
                             "remaining occurrences change");

                     const auto missing = fx.files->edit_file(op::EditFileRequest{
                         .file_path = fx.ws.file("gone.cpp"), .old_string = "a", .new_string = "b",
                         .replace_all = false});
                     require(!missing.ok() && missing.kind() == ErrorKind::NotFound, "missing file");
                   }});

  tests.push_back({"file_list_sorts_newest_first", [] {
                     FileFixture fx;
                     fx.ws.create_file("old.txt", "1");
                     fx.ws.create_file("mid.txt", "22");
                     fx.ws.create_file("new.txt", "333");
                     std::filesystem::create_directories(fx.ws.path() / "sub");
                     fx.ws.create_file("sub/deep.txt", "4");
                     touch_at(fx.ws.path() / "old.txt", 300);
                     touch_at(fx.ws.path() / "mid.txt", 200);
                     touch_at(fx.ws.path() / "sub", 150);
                     touch_at(fx.ws.path() / "new.txt", 100);

                     const auto flat = fx.files->list_directory(op::ListDirectoryRequest{
                         .path = fx.ws.path().string(), .pattern = {}, .recursive = false});
                     require(flat.ok(), flat.error());
                     const auto listed = names(flat.value());
                     require(listed == std::vector<std::string>({"new.txt", "sub", "mid.txt", "old.txt"}),
                             "newest first");
                     const auto &sub = flat.value().entries[1];
                     require(sub.is_directory && !sub.size.has_value(), "directory has no size");
                     require(flat.value().entries[0].size == 3u, "file size");

                     const auto deep = fx.files->list_directory(op::ListDirectoryRequest{
                         .path = fx.ws.path().string(), .pattern = {}, .recursive = true});
                     require(deep.ok() && deep.value().entries.size() == 5, "recursive listing");
                   }});

  tests.push_back({"file_list_applies_glob_patterns", [] {
                     FileFixture fx;
                     fx.ws.create_file("main.cpp", "");
                     fx.ws.create_file("util.hpp", "");
                     fx.ws.create_file("src/a.cpp", "");
                     fx.ws.create_file("src/nested/b.cpp", "");
                     fx.ws.create_file("src/nested/c.hpp", "");
                     const std::string root = fx.ws.path().string();

                     auto list = [&](const std::string &pattern, const bool recursive) {
                       auto result = fx.files->list_directory(op::ListDirectoryRequest{
                           .path = root, .pattern = pattern, .recursive = recursive});
                       require(result.ok(), result.error());
                       auto found = names(result.value());
                       std::sort(found.begin(), found.end());
                       return found;
                     };

                     require(list("*.cpp", false) == std::vector<std::string>({"main.cpp"}),
                             "single level");
                     require(list("*.cpp", true) ==
                                 std::vector<std::string>({"a.cpp", "b.cpp", "main.cpp"}),
                             "recursive matches file names");
                     require(list("**/*.hpp", false) ==
                                 std::vector<std::string>({"c.hpp", "util.hpp"}),
                             "double star spans directories");
                     require(list("src/*.cpp", false) == std::vector<std::string>({"a.cpp"}),
                             "relative path pattern");
                     require(list(root + "/src/**/*.{cpp,hpp}", false) ==
                                 std::vector<std::string>({"a.cpp", "b.cpp", "c.hpp"}),
                             "absolute pattern with alternatives");
                   }});

  tests.push_back({"file_list_rejects_bad_paths", [] {
                     FileFixture fx;
                     fx.ws.create_file("file.txt", "x");
                     const auto not_dir = fx.files->list_directory(op::ListDirectoryRequest{
                         .path = fx.ws.file("file.txt"), .pattern = {}, .recursive = false});
                     require(!not_dir.ok() && not_dir.kind() == ErrorKind::Validation, "file");
                     const auto missing = fx.files->list_directory(op::ListDirectoryRequest{
                         .path = fx.ws.file("absent"), .pattern = {}, .recursive = false});
                     require(!missing.ok() && missing.kind() == ErrorKind::NotFound, "missing");
                     const auto relative = fx.files->list_directory(
                         op::ListDirectoryRequest{.path = "rel", .pattern = {}, .recursive = false});
                     require(!relative.ok() && relative.kind() == ErrorKind::Validation, "relative");
                   }});

  tests.push_back({"glob_translation_covers_wildcards", [] {
                     auto matches = [](const std::string &pattern, const std::string &text) {
                       const auto matcher = op::GlobMatcher::compile(pattern);
                       return matcher.ok() && matcher.value().matches(text);
                     };
                     require(matches("*.txt", "a.txt") && !matches("*.txt", "dir/a.txt"),
                             "star stays in one segment");
                     require(matches("**/x.h", "x.h") && matches("**/x.h", "a/b/x.h"),
                             "double star slash is optional");
                     require(matches("file?.c", "file1.c") && !matches("file?.c", "file10.c"),
                             "question mark");
                     require(matches("[!a]*", "bcd") && !matches("[!a]*", "abc"), "negated class");
                     require(matches("*.{c,h}", "m.h") && !matches("*.{c,h}", "m.cc"),
                             "alternatives");
                     require(matches("a\\*b", "a*b") && !matches("a\\*b", "axb"), "escaped star");
                     require(matches("a.b", "a.b") && !matches("a.b", "axb"), "dot is literal");
                   }});
}

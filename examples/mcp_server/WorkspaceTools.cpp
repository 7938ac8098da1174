//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WorkspaceTools.cpp
// Purpose: Workspace tool implementations and their registration
//==========================================================================================================

#include "WorkspaceTools.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <poll.h>
#include <signal.h>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "mcprt/errors/Errors.h"
#include "mcprt/typed/Content.h"

namespace fs = std::filesystem;

namespace mcprt {
namespace examples {

namespace {
std::shared_ptr<JSONValue> str(const std::string& s) {
    return std::make_shared<JSONValue>(s);
}

// {"type": type} with an optional description
std::shared_ptr<JSONValue> prop(const char* type, const char* description) {
    JSONValue::Object p;
    p["type"] = str(type);
    p["description"] = str(description);
    return std::make_shared<JSONValue>(std::move(p));
}

JSONValue objectSchema(JSONValue::Object properties, std::vector<std::string> required) {
    JSONValue::Array req;
    for (const auto& r : required) {
        req.push_back(str(r));
    }
    JSONValue::Object schema;
    schema["type"] = str("object");
    schema["properties"] = std::make_shared<JSONValue>(std::move(properties));
    schema["required"] = std::make_shared<JSONValue>(std::move(req));
    schema["additionalProperties"] = std::make_shared<JSONValue>(false);
    return JSONValue{std::move(schema)};
}

std::string readAll(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in) {
        throw errors::ApplicationError(fmt::format("Cannot open {}: {}", p.string(), std::strerror(errno)));
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void writeAll(const fs::path& p, const std::string& content) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw errors::ApplicationError(fmt::format("Cannot write {}: {}", p.string(), std::strerror(errno)));
    }
    out << content;
    if (!out.flush()) {
        throw errors::ApplicationError("Write failed: " + p.string());
    }
}

int64_t checkedAdd(int64_t a, int64_t b) {
    int64_t sum = 0;
    if (__builtin_add_overflow(a, b, &sum)) {
        throw errors::ApplicationError("integer overflow");
    }
    return sum;
}

const char* const kBlockedCommands[] = {"rm -rf /", "sudo", "shutdown", "reboot", "> /dev/"};
} // namespace

Workspace::Workspace(const fs::path& r) : root(fs::weakly_canonical(fs::absolute(r))) {}

fs::path Workspace::Resolve(const std::string& p) const {
    const fs::path resolved = fs::weakly_canonical(root / p);
    const auto rel = resolved.lexically_relative(root);
    if (rel.empty() || *rel.begin() == "..") {
        throw errors::ApplicationError("Path escapes workspace: " + p);
    }
    return resolved;
}

std::string Workspace::ReadFile(const std::string& path, std::optional<int64_t> limit) const {
    const std::string text = readAll(Resolve(path));
    std::vector<std::string> lines;
    std::istringstream in(text);
    for (std::string line; std::getline(in, line);) {
        lines.push_back(line);
    }
    std::size_t keep = lines.size();
    if (limit.has_value() && limit.value() >= 0 && static_cast<std::size_t>(limit.value()) < lines.size()) {
        keep = static_cast<std::size_t>(limit.value());
    }
    std::string out;
    for (std::size_t i = 0; i < keep; ++i) {
        if (i > 0) out.push_back('\n');
        out += lines[i];
    }
    if (keep < lines.size()) {
        out += fmt::format("\n... ({} more lines)", lines.size() - keep);
    }
    return out;
}

std::string Workspace::WriteFile(const std::string& path, const std::string& content) const {
    const fs::path target = Resolve(path);
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        throw errors::ApplicationError(fmt::format("Cannot create {}: {}", target.parent_path().string(), ec.message()));
    }
    writeAll(target, content);
    return fmt::format("Wrote {} bytes to {}", content.size(), path);
}

std::string Workspace::EditFile(const std::string& path, const std::string& oldText, const std::string& newText) const {
    const fs::path target = Resolve(path);
    std::string content = readAll(target);
    const auto pos = content.find(oldText);
    if (oldText.empty() || pos == std::string::npos) {
        throw errors::ApplicationError("Text not found in " + path);
    }
    content.replace(pos, oldText.size(), newText);
    writeAll(target, content);
    return "Edited " + path;
}

std::string Workspace::RunCommand(const std::string& command, std::chrono::milliseconds timeout, std::stop_token st,
                                  std::size_t maxOutputBytes) const {
    for (const char* blocked : kBlockedCommands) {
        if (command.find(blocked) != std::string::npos) {
            throw errors::ApplicationError("Dangerous command blocked");
        }
    }
    int fds[2];
    // Close-on-exec so concurrent commands never inherit each other's write end; dup2 clears it in the child
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw errors::ApplicationError(fmt::format("pipe2 failed: {}", std::strerror(errno)));
    }
    // Everything the child touches is prepared before fork
    const std::string dir = root.string();
    const char* shell = "/bin/sh";
    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        throw errors::ApplicationError(fmt::format("fork failed: {}", std::strerror(err)));
    }
    if (pid == 0) {
        ::setpgid(0, 0);
        ::dup2(fds[1], STDOUT_FILENO);
        ::dup2(fds[1], STDERR_FILENO);
        ::close(fds[0]);
        ::close(fds[1]);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        if (::chdir(dir.c_str()) != 0) {
            ::_exit(126);
        }
        ::execl(shell, "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        ::_exit(127);
    }
    ::close(fds[1]);
    // Also set from the parent so the group exists before any kill; EACCES after exec is harmless
    (void)::setpgid(pid, pid);
    LOG_DEBUG("Workspace: started pid {} for '{}'", pid, command);

    std::string output;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool timedOut = false;
    bool cancelled = false;
    bool overflowed = false;
    char buf[4096];
    while (true) {
        if (st.stop_requested()) {
            cancelled = true;
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            timedOut = true;
            break;
        }
        pollfd pfd{fds[0], POLLIN, 0};
        const int rc = ::poll(&pfd, 1, 50);
        if (rc < 0 && errno == EINTR) continue;
        if (rc < 0) {
            LOG_WARN("Workspace: poll failed (errno={} msg={})", errno, std::strerror(errno));
            break;
        }
        if (rc == 0) continue;
        const ssize_t n = ::read(fds[0], buf, sizeof(buf));
        if (n > 0) {
            output.append(buf, static_cast<std::size_t>(n));
            if (maxOutputBytes > 0 && output.size() > maxOutputBytes) {
                LOG_WARN("Workspace: output of '{}' exceeded {} bytes; stopping it", command, maxOutputBytes);
                overflowed = true;
                break;
            }
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            break;
        }
    }
    ::close(fds[0]);
    if (timedOut || cancelled || overflowed) {
        if (::kill(-pid, SIGKILL) != 0) {
            ::kill(pid, SIGKILL);
        }
    }
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

    if (timedOut) {
        throw errors::ApplicationError(fmt::format("Command timed out after {} s",
            std::chrono::duration_cast<std::chrono::seconds>(timeout).count()));
    }
    if (cancelled) {
        throw errors::ApplicationError("Command cancelled");
    }
    // Trim surrounding whitespace
    const auto first = output.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "(no output)";
    }
    const auto last = output.find_last_not_of(" \t\r\n");
    return output.substr(first, last - first + 1);
}

void RegisterWorkspaceCapabilities(Server& server, std::shared_ptr<Workspace> ws) {
    FUNC_SCOPE();
    /////////////////////////////////////////// add_numbers ///////////////////////////////////////////
    {
        JSONValue::Object props;
        props["a"] = prop("integer", "First addend");
        props["b"] = prop("integer", "Second addend");
        Tool tool{"add_numbers", "Add two integers", objectSchema(std::move(props), {"a", "b"})};
        server.RegisterTool(tool, [](const JSONValue& args, std::stop_token) {
            return typed::textResult(std::to_string(checkedAdd(typed::integerArg(args, "a").value_or(0),
                                                               typed::integerArg(args, "b").value_or(0))));
        });
    }

    /////////////////////////////////////////// echo ///////////////////////////////////////////
    {
        JSONValue::Object props;
        props["message"] = prop("string", "Text to echo back");
        Tool tool{"echo", "Echo a message", objectSchema(std::move(props), {"message"})};
        server.RegisterTool(tool, [](const JSONValue& args, std::stop_token) {
            return typed::textResult(typed::stringArg(args, "message").value_or(""));
        });
    }

    /////////////////////////////////////////// bash ///////////////////////////////////////////
    {
        JSONValue::Object props;
        props["command"] = prop("string", "Shell command to run in the workspace");
        Tool tool{"bash", "Run a shell command in the workspace", objectSchema(std::move(props), {"command"})};
        // The command's own 120 s limit fires before the request deadline
        tool.timeout = std::chrono::milliseconds(125000);
        const std::size_t maxOutput = server.Options().maxToolOutputBytes;
        server.RegisterTool(tool, [ws, maxOutput](const JSONValue& args, std::stop_token st) {
            const std::string cmd = typed::stringArg(args, "command").value_or("");
            return typed::textResult(ws->RunCommand(cmd, std::chrono::seconds(120), st, maxOutput));
        });
    }

    /////////////////////////////////////////// read_file ///////////////////////////////////////////
    {
        JSONValue::Object props;
        props["path"] = prop("string", "Workspace-relative file path");
        JSONValue::Object limit;
        limit["type"] = str("integer");
        limit["minimum"] = std::make_shared<JSONValue>(static_cast<int64_t>(1));
        limit["description"] = str("Maximum number of lines to return");
        props["limit"] = std::make_shared<JSONValue>(std::move(limit));
        Tool tool{"read_file", "Read a text file from the workspace", objectSchema(std::move(props), {"path"})};
        server.RegisterTool(tool, [ws](const JSONValue& args, std::stop_token) {
            return typed::textResult(ws->ReadFile(typed::stringArg(args, "path").value_or(""),
                                                  typed::integerArg(args, "limit")));
        });
    }

    /////////////////////////////////////////// write_file ///////////////////////////////////////////
    {
        JSONValue::Object props;
        props["path"] = prop("string", "Workspace-relative file path");
        props["content"] = prop("string", "New file content");
        Tool tool{"write_file", "Write a file in the workspace", objectSchema(std::move(props), {"path", "content"})};
        tool.nonReentrant = true;
        server.RegisterTool(tool, [ws](const JSONValue& args, std::stop_token) {
            return typed::textResult(ws->WriteFile(typed::stringArg(args, "path").value_or(""),
                                                   typed::stringArg(args, "content").value_or("")));
        });
    }

    /////////////////////////////////////////// edit_file ///////////////////////////////////////////
    {
        JSONValue::Object props;
        props["path"] = prop("string", "Workspace-relative file path");
        props["old_text"] = prop("string", "Exact text to replace (first occurrence)");
        props["new_text"] = prop("string", "Replacement text");
        Tool tool{"edit_file", "Replace text in a workspace file",
                  objectSchema(std::move(props), {"path", "old_text", "new_text"})};
        tool.nonReentrant = true;
        server.RegisterTool(tool, [ws](const JSONValue& args, std::stop_token) {
            return typed::textResult(ws->EditFile(typed::stringArg(args, "path").value_or(""),
                                                  typed::stringArg(args, "old_text").value_or(""),
                                                  typed::stringArg(args, "new_text").value_or("")));
        });
    }

    /////////////////////////////////////////// config://server ///////////////////////////////////////////
    {
        Resource res{"config://server", "Server configuration", std::string("Effective runtime options"),
                     std::string("application/json")};
        const ServerOptions& o = server.Options();
        JSONValue::Object cfg;
        cfg["serverName"] = str(o.serverName);
        cfg["serverVersion"] = str(o.serverVersion);
        cfg["requestTimeoutMs"] = std::make_shared<JSONValue>(static_cast<int64_t>(o.requestTimeout.count()));
        cfg["maxConcurrency"] = std::make_shared<JSONValue>(static_cast<int64_t>(o.maxConcurrency));
        cfg["shutdownGraceMs"] = std::make_shared<JSONValue>(static_cast<int64_t>(o.shutdownGrace.count()));
        cfg["maxToolOutputBytes"] = std::make_shared<JSONValue>(static_cast<int64_t>(o.maxToolOutputBytes));
        cfg["validation"] = str(validation::toString(o.validationMode));
        cfg["workspace"] = str(ws->Root().string());
        const std::string text = SerializeJSON(JSONValue{std::move(cfg)});
        server.RegisterResource(res, [text](const std::string& uri, std::stop_token) {
            ReadResourceResult r;
            r.contents.push_back(typed::makeTextResource(uri, "application/json", text));
            return r;
        });
    }

    /////////////////////////////////////////// code_review ///////////////////////////////////////////
    {
        Prompt prompt{"code_review", "Review a workspace file",
                      {PromptArgument{"path", "File to review", true},
                       PromptArgument{"focus", "Aspect to concentrate on", false}}};
        server.RegisterPrompt(prompt, [](const JSONValue& args, std::stop_token) {
            const std::string path = typed::stringArg(args, "path").value_or("");
            const auto focus = typed::stringArg(args, "focus");
            GetPromptResult r;
            r.description = "Code review of " + path;
            std::string text = "Please review the file " + path + " and point out bugs and risky constructs.";
            if (focus.has_value() && !focus->empty()) {
                text += " Focus on " + focus.value() + ".";
            }
            r.messages.push_back(typed::makePromptMessage("user", text));
            return r;
        });
    }
}

} // namespace examples
} // namespace mcprt

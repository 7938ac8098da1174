//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WorkspaceTools.h
// Purpose: Workspace-confined file and shell tools for the example stdio server
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

#include "mcprt/Server.h"

namespace mcprt {
namespace examples {

//==========================================================================================================
// Workspace
// Purpose: All paths are resolved against root and must stay inside it. Failures throw
//          errors::ApplicationError so the client sees an isError tool result.
//==========================================================================================================
class Workspace {
public:
    explicit Workspace(const std::filesystem::path& root);

    const std::filesystem::path& Root() const { return root; }

    // Resolves p relative to the root; throws when the result escapes the workspace.
    std::filesystem::path Resolve(const std::string& p) const;

    //==========================================================================================================
    // ReadFile
    // Args:
    //   path: Workspace-relative path.
    //   limit: When set and smaller than the line count, only the first `limit` lines are returned followed
    //          by a "... (N more lines)" marker.
    //==========================================================================================================
    std::string ReadFile(const std::string& path, std::optional<int64_t> limit) const;

    // Creates parent directories as needed and replaces the file content.
    std::string WriteFile(const std::string& path, const std::string& content) const;

    // Replaces the first occurrence of oldText.
    std::string EditFile(const std::string& path, const std::string& oldText, const std::string& newText) const;

    //==========================================================================================================
    // RunCommand
    // Purpose: Runs command with /bin/sh -c inside the workspace, capturing stdout and stderr together.
    //          The process group is killed on timeout or when st is signalled.
    // Args:
    //   maxOutputBytes: When non-zero, the command is killed once its output exceeds this size and the
    //                   output collected so far is returned.
    //==========================================================================================================
    std::string RunCommand(const std::string& command, std::chrono::milliseconds timeout, std::stop_token st,
                           std::size_t maxOutputBytes = 0) const;

private:
    std::filesystem::path root;
};

//==========================================================================================================
// RegisterWorkspaceCapabilities
// Purpose: Registers tools (add_numbers, echo, bash, read_file, write_file, edit_file), the config://server
//          resource, and the code_review prompt.
//==========================================================================================================
void RegisterWorkspaceCapabilities(Server& server, std::shared_ptr<Workspace> workspace);

} // namespace examples
} // namespace mcprt

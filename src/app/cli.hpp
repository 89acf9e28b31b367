#pragma once

#include "app/command_pipeline.hpp"
#include "core/result.hpp"
#include <QString>
#include <QStringList>

namespace tagsync::app {

struct CliOptions {
    bool json = false;
    bool merge = false;
};

// Maps a store command line (`tags`, `create-tag <name>`, `import <file>`, ...)
// to a pipeline request. `sync`, `status` and `run` are handled by main.
[[nodiscard]] Res<Request> request_for_command(const QStringList& args, const CliOptions& options);

// Human-readable (or, with options.json, indented JSON) rendering of a response.
[[nodiscard]] QString format_response(const QString& command,
                                      const Response& response,
                                      const CliOptions& options);

[[nodiscard]] QString cli_usage();

} // namespace tagsync::app

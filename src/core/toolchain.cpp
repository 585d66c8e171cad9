#include "core/toolchain.hpp"

#include <stdexcept>

namespace spectre::make {

Toolchain::Toolchain(ToolchainConfig config, ProcessRunner runner)
    : config_(std::move(config))
    , runner_(runner)
{
}

std::vector<std::string> Toolchain::build_compile_args(const CompileTask& task) const {
    std::vector<std::string> args;

    args.push_back(config_.compiler);

    // Profile flags come first so include paths and -c/-o are never shadowed
    for (const auto& flag : task.flags) {
        args.push_back(flag);
    }

    for (const auto& include : task.include_paths) {
        args.push_back("-I" + include.string());
    }

    args.push_back("-c");
    args.push_back(task.source.string());
    args.push_back("-o");
    args.push_back(task.object.string());

    return args;
}

std::vector<std::string> Toolchain::build_archive_args(const ArchiveTask& task) const {
    std::vector<std::string> args;

    args.push_back(config_.archiver);

    // r = insert/replace, c = create, s = write index
    args.push_back("rcs");

    args.push_back(task.library.string());

    for (const auto& obj : task.objects) {
        args.push_back(obj.string());
    }

    return args;
}

std::vector<std::string> Toolchain::build_link_args(const LinkTask& task) const {
    std::vector<std::string> args;

    args.push_back(config_.compiler);

    for (const auto& obj : task.objects) {
        args.push_back(obj.string());
    }

    if (!task.library.empty()) {
        args.push_back(task.library.string());
    }

    for (const auto& flag : task.flags) {
        args.push_back(flag);
    }

    args.push_back("-o");
    args.push_back(task.output.string());

    return args;
}

Toolchain::Result Toolchain::compile(const CompileTask& task) const {
    if (task.source.empty()) {
        throw std::runtime_error("CompileTask must specify a source file");
    }
    if (task.object.empty()) {
        throw std::runtime_error("CompileTask must specify an object file");
    }
    return execute(build_compile_args(task));
}

Toolchain::Result Toolchain::archive(const ArchiveTask& task) const {
    if (task.library.empty()) {
        throw std::runtime_error("ArchiveTask must specify a library file");
    }
    return execute(build_archive_args(task));
}

Toolchain::Result Toolchain::link(const LinkTask& task) const {
    if (task.output.empty()) {
        throw std::runtime_error("LinkTask must specify an output file");
    }
    return execute(build_link_args(task));
}

std::string Toolchain::get_version() const {
    Result result = execute({config_.compiler, "--version"});

    if (!result.success()) {
        throw std::runtime_error(
            "Failed to get compiler version: " + result.stderr_output
        );
    }

    std::string version = result.stdout_output;
    auto eol = version.find('\n');
    if (eol != std::string::npos) {
        version.erase(eol);
    }

    // Trim whitespace
    version.erase(0, version.find_first_not_of(" \t\r"));
    version.erase(version.find_last_not_of(" \t\r") + 1);

    return version;
}

Toolchain::Result Toolchain::execute(const std::vector<std::string>& args) const {
    if (observer_) {
        observer_(args);
    }
    return runner_.run(args);
}

} // namespace spectre::make

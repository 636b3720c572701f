#include "trellis/toolchain.hpp"

#include "trellis/environment.hpp"

#include <algorithm>
#include <format>

namespace trellis {

std::string_view to_string(TargetKind kind) {
    switch (kind) {
    case TargetKind::StaticLibrary:
        return "static library";
    case TargetKind::SharedLibrary:
        return "shared library";
    case TargetKind::Program:
        return "program";
    case TargetKind::Interface:
        return "interface library";
    case TargetKind::Object:
        return "object library";
    case TargetKind::Command:
        return "command";
    case TargetKind::Install:
        return "install";
    case TargetKind::InstallAs:
        return "install";
    }
    return "target";
}

namespace {

constexpr std::string_view link_libs = "${prefix(-L, link.libdirs)} ${prefix(-l, link.libs)}";

} // namespace

GnuToolchain::GnuToolchain()
    : separated_{"-F", "-framework", "-arch", "-isystem", "-include", "-Xlinker"} {
    handlers_.emplace(".c", SourceHandler{.suffix = ".c", .tool = "cc", .language = "c"});
    for (std::string suffix : {".cc", ".cpp", ".cxx", ".C"})
        handlers_.emplace(suffix, SourceHandler{.suffix = suffix, .tool = "cxx", .language = "c++"});
    handlers_.emplace(".S", SourceHandler{.suffix = ".S", .tool = "cc", .language = "asm"});
}

void GnuToolchain::setup(Environment &env) const {
    for (auto [tool, cmd] : {std::pair{"cc", "gcc"}, std::pair{"cxx", "g++"}}) {
        ToolConfig &config = env.tool(tool);
        config.set_cmd(cmd);
        config.set_flags({});
        config.set("depflags", "-MMD -MF $$out.d");
        config.set("objcmd", std::format("${0}.cmd ${0}.flags $$includes $$defines $$extra_flags ${0}.depflags "
                                         "-c -o $$out $$in",
                                         tool));
        config.set("progcmd", std::format("${0}.cmd $link.flags $$ldflags -o $$out $$in $$libdirs $$libs {1}", tool,
                                          link_libs));
        config.set("sharedcmd", std::format("${0}.cmd -shared $link.flags $$ldflags -o $$out $$in $$libdirs $$libs {1}",
                                            tool, link_libs));
        config.add_builder(Builder{.name = tool == std::string_view("cc") ? "Object" : "CxxObject",
                                   .command_var = "objcmd",
                                   .src_suffixes = tool == std::string_view("cc")
                                                       ? std::vector<std::string>{".c", ".S"}
                                                       : std::vector<std::string>{".cc", ".cpp", ".cxx", ".C"},
                                   .target_suffix = ".o",
                                   .language = tool == std::string_view("cc") ? "c" : "c++",
                                   .single_source = true,
                                   .depfile = "$out.d",
                                   .deps_style = "gcc"});
    }

    ToolConfig &ar = env.tool("ar");
    ar.set_cmd("ar");
    ar.set_flags({"rcs"});
    ar.set("libcmd", "$ar.cmd $ar.flags $$out $$in");
    ar.add_builder(Builder{.name = "StaticLibrary", .command_var = "libcmd", .target_suffix = ".a"});

    ToolConfig &link = env.tool("link");
    link.set_flags({});
    link.set("libs", std::vector<std::string>{});
    link.set("libdirs", std::vector<std::string>{});

    ToolConfig &copy = env.tool("copy");
    copy.set_cmd("cp");
    copy.set("copycmd", "$copy.cmd $$in $$out");
    copy.add_builder(Builder{.name = "Copy", .command_var = "copycmd", .single_source = true});
}

const SourceHandler *GnuToolchain::source_handler(std::string_view suffix) const {
    if (auto it = handlers_.find(suffix); it != handlers_.end())
        return &it->second;
    return nullptr;
}

std::string GnuToolchain::output_name(TargetKind kind, std::string_view base) const {
    switch (kind) {
    case TargetKind::StaticLibrary:
        return std::format("lib{}.a", base);
    case TargetKind::SharedLibrary:
        return std::format("lib{}.so", base);
    default:
        return std::string(base);
    }
}

std::vector<std::string> GnuToolchain::compile_flags_for(TargetKind kind) const {
    if (kind == TargetKind::SharedLibrary)
        return {"-fPIC"};
    return {};
}

std::string GnuToolchain::linker_for_languages(const std::vector<std::string> &languages) const {
    return std::ranges::find(languages, "c++") != languages.end() ? "cxx" : "cc";
}

LinkStep GnuToolchain::link_step(TargetKind kind, const std::vector<std::string> &languages) const {
    switch (kind) {
    case TargetKind::StaticLibrary:
        return {"ar", "libcmd"};
    case TargetKind::SharedLibrary:
        return {linker_for_languages(languages), "sharedcmd"};
    default:
        return {linker_for_languages(languages), "progcmd"};
    }
}

Result<void> GnuToolchain::apply_variant(Environment &env, std::string_view variant) const {
    std::vector<std::string> flags;
    if (variant == "debug") {
        flags = {"-g", "-O0"};
    } else if (variant == "release") {
        flags = {"-O2", "-DNDEBUG"};
    } else if (variant != "default") {
        return fail(ErrorKind::Builder, std::format("unknown build variant '{}' for the {} toolchain", variant, name()),
                    env.origin());
    }

    for (const auto *tool : {"cc", "cxx"}) {
        if (env.has_tool(tool))
            env.tool(tool).add_flags(flags);
    }
    return {};
}

} // namespace trellis

#pragma once

#include "trellis/flags.hpp"
#include "trellis/utility.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace trellis {

class Environment;

enum class TargetKind { StaticLibrary, SharedLibrary, Program, Interface, Object, Command, Install, InstallAs };

std::string_view to_string(TargetKind kind);

/// How sources with one suffix are compiled: which tool, which command variable, and what they produce.
struct SourceHandler {
    std::string suffix;
    std::string tool;
    std::string language;
    std::string object_suffix = ".o";
    std::string command_var = "objcmd";
    std::string depfile = "$out.d";
    std::string deps_style = "gcc";
};

/// Tool and command variable of a link or archive step.
struct LinkStep {
    std::string tool;
    std::string command_var;
};

/**
 * @brief Compiler and linker knowledge consumed by the core.
 *
 * A toolchain seeds an environment with tool namespaces, maps source suffixes to handlers, names outputs, and declares
 * which flags take a separate argument. The core carries no compiler-specific knowledge of its own.
 */
class Toolchain {
public:
    virtual ~Toolchain() = default;

    virtual std::string name() const = 0;
    virtual void setup(Environment &env) const = 0;

    virtual const SourceHandler *source_handler(std::string_view suffix) const = 0;
    virtual const SeparatedArgs &separated_arg_flags() const = 0;

    /// File name of the output of a `kind` target called `base`.
    virtual std::string output_name(TargetKind kind, std::string_view base) const = 0;
    /// Flags every object of a `kind` target is compiled with.
    virtual std::vector<std::string> compile_flags_for(TargetKind kind) const = 0;

    /// Tool that links objects of the given languages.
    virtual std::string linker_for_languages(const std::vector<std::string> &languages) const = 0;
    virtual LinkStep link_step(TargetKind kind, const std::vector<std::string> &languages) const = 0;

    virtual Result<void> apply_variant(Environment &env, std::string_view variant) const = 0;
};

/// gcc, g++, ar and cp on a Unix-like host.
class GnuToolchain : public Toolchain {
public:
    GnuToolchain();

    std::string name() const override {
        return "gnu";
    }
    void setup(Environment &env) const override;

    const SourceHandler *source_handler(std::string_view suffix) const override;
    const SeparatedArgs &separated_arg_flags() const override {
        return separated_;
    }

    std::string output_name(TargetKind kind, std::string_view base) const override;
    std::vector<std::string> compile_flags_for(TargetKind kind) const override;

    std::string linker_for_languages(const std::vector<std::string> &languages) const override;
    LinkStep link_step(TargetKind kind, const std::vector<std::string> &languages) const override;

    Result<void> apply_variant(Environment &env, std::string_view variant) const override;

private:
    std::map<std::string, SourceHandler, std::less<>> handlers_;
    SeparatedArgs separated_;
};

} // namespace trellis

#include <safejump/analysis/analysis_fmt.hpp>
#include <safejump/analysis/control_flow_validator.hpp>
#include <safejump/config.hpp>
#include <safejump/core/byte_string.hpp>
#include <safejump/core/log_level_map.hpp>
#include <safejump/evm/code.hpp>

#include <CLI/CLI.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <boost/algorithm/hex.hpp>

#include <fmt/format.h>

#include <evmc/evmc.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>

using namespace safejump;
namespace fs = std::filesystem;

ANONYMOUS_NAMESPACE_BEGIN

std::optional<byte_string> decode_hex(std::string hex)
{
    std::erase_if(hex, [](unsigned char const c) {
        return std::isspace(c) != 0;
    });
    if (hex.starts_with("0x") || hex.starts_with("0X")) {
        hex.erase(0, 2);
    }
    byte_string code;
    try {
        boost::algorithm::unhex(
            hex.begin(), hex.end(), std::back_inserter(code));
    }
    catch (boost::algorithm::hex_decode_error const &) {
        return std::nullopt;
    }
    return code;
}

std::optional<std::string> read_file(fs::path const &path)
{
    std::ifstream in{path};
    if (!in) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

ANONYMOUS_NAMESPACE_END

int main(int const argc, char const *argv[])
{
    CLI::App cli{"safejump"};
    cli.option_defaults()->always_capture_default();

    std::string code_hex;
    fs::path code_file;
    evmc_revision revision = evm::default_revision;
    bool strict = false;
    bool no_implicit_stop = false;
    auto log_level = quill::LogLevel::Info;

    std::unordered_map<std::string, evmc_revision> const REVISION_MAP = {
        {"frontier", EVMC_FRONTIER},
        {"homestead", EVMC_HOMESTEAD},
        {"tangerine_whistle", EVMC_TANGERINE_WHISTLE},
        {"spurious_dragon", EVMC_SPURIOUS_DRAGON},
        {"byzantium", EVMC_BYZANTIUM},
        {"constantinople", EVMC_CONSTANTINOPLE},
        {"petersburg", EVMC_PETERSBURG},
        {"istanbul", EVMC_ISTANBUL},
        {"berlin", EVMC_BERLIN},
        {"london", EVMC_LONDON},
        {"paris", EVMC_PARIS},
        {"shanghai", EVMC_SHANGHAI},
        {"cancun", EVMC_CANCUN}};

    auto *const group =
        cli.add_option_group("input", "bytecode to validate");
    group->add_option("--code", code_hex, "hex encoded bytecode");
    group->add_option("--file", code_file, "file holding hex encoded bytecode")
        ->check(CLI::ExistingFile);
    group->require_option(1);
    cli.add_option("--revision", revision, "evm revision")
        ->transform(CLI::CheckedTransformer(REVISION_MAP, CLI::ignore_case));
    cli.add_flag(
        "--strict",
        strict,
        "require the same stack height on every path into an instruction");
    cli.add_flag(
        "--no_implicit_stop",
        no_implicit_stop,
        "reject code that can run off its end");
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::ParseError const &e) {
        auto const rc = cli.exit(e);
        return rc == 0 ? 0 : 2;
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(ascii_time) [%(thread)] %(filename):%(lineno) LOG_%(level_name)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    if (!code_file.empty()) {
        auto contents = read_file(code_file);
        if (!contents.has_value()) {
            LOG_ERROR("could not read {}", code_file.string());
            return 2;
        }
        code_hex = std::move(contents.value());
    }
    auto const bytes = decode_hex(code_hex);
    if (!bytes.has_value()) {
        LOG_ERROR("input is not valid hex");
        return 2;
    }

    evm::Code const code{*bytes, revision};
    analysis::ControlFlowValidator validator{
        code,
        analysis::ValidatorConfig{
            .implicit_stop_at_end = !no_implicit_stop,
            .require_consistent_stack_height = strict}};
    LOG_INFO(
        "validating {} bytes, {} jump destinations",
        code.size(),
        code.jump_dest_count());

    auto const res = validator.validate();
    quill::flush();
    if (res.has_error()) {
        fmt::print("invalid: {}\n", validator.failure().value());
        return 1;
    }
    fmt::print("valid: {}\n", validator.stats());
    return 0;
}

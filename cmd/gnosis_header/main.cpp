// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <gnosis/core/byte_string.hpp>
#include <gnosis/core/bytes.hpp>
#include <gnosis/core/result.hpp>
#include <gnosis/execution/core/fmt/bytes_fmt.hpp>
#include <gnosis/execution/core/fmt/gnosis_header_fmt.hpp>
#include <gnosis/execution/core/gnosis_header.hpp>
#include <gnosis/execution/core/log_level_map.hpp>
#include <gnosis/execution/core/rlp/gnosis_header_rlp.hpp>
#include <gnosis/execution/validate_header.hpp>

#include <CLI/CLI.hpp>

#include <evmc/evmc.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <utility>

using namespace gnosis;
namespace fs = std::filesystem;

namespace
{
    std::optional<byte_string> read_input(
        std::string const &hex, fs::path const &file)
    {
        if (!file.empty()) {
            std::ifstream is(file, std::ios::binary);
            if (!is) {
                LOG_ERROR("could not open {}", file.string());
                return std::nullopt;
            }
            return byte_string{
                std::istreambuf_iterator<char>(is),
                std::istreambuf_iterator<char>()};
        }

        auto decoded = evmc::from_hex(hex);
        if (!decoded.has_value()) {
            LOG_ERROR("input is not hex encoded");
            return std::nullopt;
        }
        return std::move(decoded).value();
    }
}

int main(int const argc, char const *argv[])
{
    CLI::App cli{"gnosis-header"};
    cli.option_defaults()->always_capture_default();

    std::string hex;
    fs::path file;
    bool strict = false;
    auto log_level = quill::LogLevel::Info;

    auto *const group = cli.add_option_group("input", "encoded header");
    group->add_option("--hex", hex, "rlp encoded header as hex");
    group->add_option("--file", file, "file holding the rlp encoded header")
        ->check(CLI::ExistingFile);
    group->require_option(1);
    cli.add_flag(
        "--strict",
        strict,
        "reject headers whose fork fields are not a prefix of the fork order");
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(time) [%(thread_id)] %(file_name):%(line_number) LOG_%(log_level)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    auto const input = read_input(hex, file);
    if (!input.has_value()) {
        return 1;
    }
    LOG_DEBUG("read {} bytes", input->size());

    byte_string_view enc{*input};
    rlp::HeaderDecodeDiagnostics diagnostics;
    auto const header = rlp::decode_gnosis_header(enc, diagnostics);
    if (header.has_error()) {
        LOG_ERROR(
            "decode failed at {}: {} (expected {}, actual {})",
            rlp::header_field_name(diagnostics.field),
            header.error().message().c_str(),
            diagnostics.expected,
            diagnostics.actual);
        return 1;
    }
    if (!enc.empty()) {
        LOG_WARNING("{} trailing bytes after the header", enc.size());
    }

    if (strict) {
        auto const valid = validate_fork_fields(header.value());
        if (valid.has_error()) {
            LOG_ERROR(
                "validation failed: {}", valid.error().message().c_str());
            return 1;
        }
    }

    LOG_INFO("{}", header.value());
    LOG_INFO(
        "{} header, hash {}",
        is_post_merge(header.value()) ? "post merge" : "pre merge",
        hash(header.value()));

    auto const reencoded = rlp::encode_gnosis_header(header.value());
    byte_string_view const consumed{input->data(), input->size() - enc.size()};
    if (reencoded != consumed) {
        LOG_WARNING(
            "re-encoding differs: {} bytes in, {} bytes out",
            consumed.size(),
            reencoded.size());
    }
    else {
        LOG_INFO("re-encoding is byte identical");
    }

    return 0;
}

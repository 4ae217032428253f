#include "di/cli/parser.h"
#include "di/container/string/string_view.h"
#include "dius/main.h"
#include "dius/print.h"
#include "dius/sync_file.h"
#include "termgrid/buffer.h"

namespace termgrid {
struct Args {
    di::Vector<di::TransparentStringView> files;
    u32 rows { 24 };
    u32 cols { 80 };
    usize scroll_back { terminal::ScrollBack::default_max_rows };
    bool flex_width { false };
    di::Optional<di::TransparentStringView> ambiguous_width;
    bool no_smart_wrap { false };
    bool no_auto_wrap { false };
    bool verbose { false };
    bool help { false };

    constexpr static auto get_cli_parser() {
        return di::cli_parser<Args>("termgrid"_sv, "Render text through a terminal screen model"_sv)
            .option<&Args::rows>('r', "rows"_tsv, "Screen rows"_sv)
            .option<&Args::cols>('c', "cols"_tsv, "Screen columns"_sv)
            .option<&Args::scroll_back>('s', "scroll-back"_tsv, "Maximum scroll back rows"_sv)
            .option<&Args::flex_width>('f', "flex-width"_tsv, "Compute cell widths from East Asian width"_sv)
            .option<&Args::ambiguous_width>('a', "ambiguous-width"_tsv,
                                            "Width of ambiguous characters (auto, narrow, wide)"_sv)
            .option<&Args::no_smart_wrap>('W', "no-smart-wrap"_tsv, "Wrap mid-word instead of at word boundaries"_sv)
            .option<&Args::no_auto_wrap>('n', "no-auto-wrap"_tsv, "Overwrite the last column instead of wrapping"_sv)
            .option<&Args::verbose>('v', "verbose"_tsv, "Print buffer state to stderr"_sv)
            .argument<&Args::files>("FILES"_sv, "Files to write through the buffer (stdin if none)"_sv)
            .help();
    }
};

static auto parse_ambiguous_width(di::Optional<di::TransparentStringView> value) -> di::Result<AmbiguousWidthMode> {
    if (!value) {
        return AmbiguousWidthMode::Auto;
    }
    auto name = value.value();
    if (name == "auto"_tsv) {
        return AmbiguousWidthMode::Auto;
    }
    if (name == "narrow"_tsv) {
        return AmbiguousWidthMode::Narrow;
    }
    if (name == "wide"_tsv) {
        return AmbiguousWidthMode::Wide;
    }
    dius::eprintln("error: invalid ambiguous width, expected one of auto, narrow, wide"_sv);
    return di::Unexpected(di::BasicError::InvalidArgument);
}

static void feed(Buffer& buffer, di::StringView text) {
    for (auto code_point : text) {
        switch (code_point) {
            case U'\n':
                buffer.newline();
                break;
            case U'\r':
                buffer.carriage_return();
                break;
            case U'\t':
                buffer.tab();
                break;
            case U'\b':
                buffer.backspace();
                break;
            default:
                // Remaining C0 controls and DEL have no effect on the screen.
                if (code_point < 0x20 || code_point == 0x7F) {
                    break;
                }
                buffer.write_code_point(code_point);
                break;
        }
    }
}

static void print_state(Buffer const& buffer) {
    auto cursor = buffer.cursor();
    auto size = buffer.effective_size();
    dius::eprintln("size: {}x{} scroll_back: {} cursor: {},{} dirty: {}"_sv, size.rows, size.cols,
                   buffer.scroll_back_size(), cursor.row, cursor.col, buffer.is_dirty());
}

static auto main(Args& args) -> di::Result<void> {
    auto config = BufferConfig {
        .size = { args.rows, args.cols },
        .max_scroll_back_rows = args.scroll_back,
        .auto_wrap = !args.no_auto_wrap,
        .smart_word_wrap = !args.no_smart_wrap,
        .flex_width = args.flex_width,
        .ambiguous_width = TRY(parse_ambiguous_width(args.ambiguous_width)),
    };
    if (config.size.rows == 0 || config.size.cols == 0) {
        dius::eprintln("error: termgrid requires a non-empty screen size"_sv);
        return di::Unexpected(di::BasicError::InvalidArgument);
    }

    auto buffer = Buffer(config);
    if (args.files.empty()) {
        auto text = TRY(di::read_to_string(dius::stdin));
        feed(buffer, text);
    }
    for (auto path : args.files) {
        auto file = TRY(dius::open_sync(di::PathView(path), dius::OpenMode::Readonly));
        auto text = TRY(di::read_to_string(file));
        feed(buffer, text);
        if (args.verbose) {
            print_state(buffer);
        }
    }

    dius::print("{}"_sv, buffer.scroll_back_text());
    if (args.verbose && args.files.empty()) {
        print_state(buffer);
    }
    return {};
}
}

DIUS_MAIN(termgrid::Args, termgrid)

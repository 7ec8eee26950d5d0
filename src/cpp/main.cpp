#include <CLI/CLI.hpp>
#include <ips/ips.h>

#include <chrono>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

using namespace ips;

// ── error reporting ──────────────────────────────────────────────────────

static void print_error(const std::exception& e, int depth = 0) {
    if (depth == 0) {
        std::fprintf(stderr, "Error: %s\n", e.what());
    } else {
        std::fprintf(stderr, "  caused by: %s\n", e.what());
    }
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& cause) {
        print_error(cause, depth + 1);
    }
}

static void print_summary(const PatchSummary& stats) {
    std::printf("Hunks:        %zu\n", stats.num_hunks);
    std::printf("  Regular:    %zu (%zu bytes)\n", stats.num_regular, stats.regular_bytes);
    std::printf("  RLE:        %zu (%zu bytes)\n", stats.num_rle, stats.rle_bytes);
    std::printf("Write bytes:  %zu\n", stats.total_write_bytes);
    std::printf("Highest end:  0x%06llx\n", (unsigned long long)stats.max_end);
    if (stats.truncate) {
        std::printf("Truncate:     %u bytes\n", static_cast<unsigned>(*stats.truncate));
    } else {
        std::printf("Truncate:     none\n");
    }
}

static void print_hunks(const Patch& patch) {
    size_t idx = 0;
    for (const auto& hunk : patch.hunks) {
        if (auto* h = std::get_if<RegularHunk>(&hunk)) {
            std::printf("%6zu  regular  0x%06x  %5zu bytes\n", idx,
                static_cast<unsigned>(h->offset), hunk_size(hunk));
        } else if (auto* r = std::get_if<RleHunk>(&hunk)) {
            std::printf("%6zu  rle      0x%06x  %5u x 0x%02x\n", idx,
                static_cast<unsigned>(r->offset), static_cast<unsigned>(r->run_length),
                static_cast<unsigned>(r->payload));
        }
        ++idx;
    }
}

// ── main ─────────────────────────────────────────────────────────────────

int main(int argc, char** argv) {
    CLI::App app{"IPS patch tool"};
    app.require_subcommand(1);

    // ── apply subcommand ─────────────────────────────────────────────
    auto* apl = app.add_subcommand("apply", "Apply an IPS patch to a file");
    std::string apl_patch, apl_target, apl_output;
    apl->add_option("patch_file", apl_patch, "IPS patch file")->required();
    apl->add_option("target", apl_target, "File to patch")->required();
    apl->add_option("--output", apl_output, "Patch a copy of target written here");
    bool apl_stream = false;
    apl->add_flag("--stream", apl_stream, "Apply hunks while reading the patch");
    bool apl_verbose = false;
    apl->add_flag("--verbose", apl_verbose, "Trace each hunk");

    // ── info subcommand ──────────────────────────────────────────────
    auto* inf = app.add_subcommand("info", "Show IPS patch statistics");
    std::string info_patch;
    inf->add_option("patch_file", info_patch, "IPS patch file")->required();
    bool info_hunks = false;
    inf->add_flag("--hunks", info_hunks, "List every hunk");

    CLI11_PARSE(app, argc, argv);

    try {
        if (apl->parsed()) {
            ApplyOptions opts;
            opts.verbose = apl_verbose;

            // Open the patch first so a missing or malformed patch leaves
            // no --output copy behind.
            std::unique_ptr<FileSource> src;
            std::optional<Patch> patch;
            if (apl_stream) {
                src = std::make_unique<FileSource>(apl_patch);
            } else {
                MappedFile patch_file(apl_patch);
                patch = read_patch(patch_file.span());
            }

            std::string path = apl_target;
            if (!apl_output.empty()) {
                std::filesystem::copy_file(apl_target, apl_output,
                    std::filesystem::copy_options::overwrite_existing);
                path = apl_output;
            }

            auto t0 = std::chrono::steady_clock::now();
            FileTarget target(path);
            if (src) {
                apply_ips_patch(*src, target, opts);
            } else {
                apply_patch(*patch, target, opts);
                if (opts.verbose) {
                    auto stats = patch_summary(*patch);
                    std::fprintf(stderr, "applied %zu hunks (%zu bytes)\n",
                        stats.num_hunks, stats.total_write_bytes);
                }
            }
            auto t1 = std::chrono::steady_clock::now();
            double elapsed = std::chrono::duration<double>(t1 - t0).count();

            std::printf("Mode:         %s\n", apl_stream ? "streaming" : "buffered");
            std::printf("Patch:        %s\n", apl_patch.c_str());
            std::printf("Output:       %s (%llu bytes)\n", path.c_str(),
                (unsigned long long)target.size());
            std::printf("Time:         %.3fs\n", elapsed);

        } else if (inf->parsed()) {
            MappedFile patch_file(info_patch);
            auto patch = read_patch(patch_file.span());

            std::printf("Patch file:   %s (%zu bytes)\n", info_patch.c_str(), patch_file.size());
            print_summary(patch_summary(patch));
            if (info_hunks) print_hunks(patch);
        }
    } catch (const std::exception& e) {
        print_error(e);
        return 1;
    }

    return 0;
}

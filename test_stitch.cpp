#include <algorithm>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "brstitch/brstitch.hpp"
#include "brstitch/confirm.hpp"
#include "brstitch/errors.hpp"
#include "brstitch/fileio.hpp"
#include "brstitch/header.hpp"
#include "brstitch/interrupt.hpp"
#include "brstitch/log.hpp"
#include "brstitch/registry.hpp"
#include "brstitch/stitcher.hpp"
#include "brstitch/validator.hpp"

namespace {

namespace fs = std::filesystem;
using Bytes = std::vector<std::uint8_t>;
using brstitch::GroupCondition;
using brstitch::confirm::ConfirmPolicy;
using brstitch::confirm::Confirmer;

int g_failures = 0;

void Check(bool ok, const std::string& what) {
    std::cout << (ok ? "  ok    " : "  FAIL  ") << what << std::endl;
    if (!ok) {
        ++g_failures;
    }
}

template<typename Exc, typename Fn>
bool Throws(Fn&& fn) {
    try {
        fn();
    } catch (const Exc&) {
        return true;
    } catch (const std::exception&) {
        return false;
    }
    return false;
}

class TempDir {
public:
    TempDir() {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        for (int i = 0; i < 64; ++i) {
            auto candidate = fs::temp_directory_path() / ("brstitch-test-" + std::to_string(gen()));
            std::error_code ec;
            if (fs::create_directory(candidate, ec)) {
                path_ = candidate;
                return;
            }
        }
        throw std::runtime_error("Failed to create temporary directory");
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }
    fs::path operator/(const std::string& leaf) const { return path_ / leaf; }

private:
    fs::path path_;
};

Bytes SampleData(std::size_t size, std::uint32_t seed) {
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> byte(0, 255);
    Bytes out(size);
    for (std::size_t i = 0; i < size; ++i) {
        out[i] = (i / 300) % 3 == 0 ? static_cast<std::uint8_t>('a' + i % 26) : static_cast<std::uint8_t>(byte(gen));
    }
    return out;
}

void WriteBytes(const fs::path& path, const Bytes& data) {
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out) {
        throw std::runtime_error("test setup: cannot write " + path.string());
    }
}

Bytes ReadBytes(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return Bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

void WriteSection(const fs::path& path, const std::string& name, std::uint32_t index, bool compressed, bool last,
                  const Bytes& payload = {}) {
    auto head = brstitch::header::Encode(name, index, compressed, last);
    Bytes data(head.begin(), head.end());
    data.insert(data.end(), payload.begin(), payload.end());
    WriteBytes(path, data);
}

std::vector<fs::path> SectionFilesIn(const fs::path& dir) {
    std::vector<fs::path> out;
    if (!fs::exists(dir)) {
        return out;
    }
    for (const auto& entry : fs::recursive_directory_iterator(dir)) {
        if (entry.is_regular_file() && brstitch::fileio::HasSectionExtension(entry.path())) {
            out.push_back(entry.path());
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

brstitch::header::Header Hdr(const std::string& name, std::uint32_t index, bool compressed, bool last) {
    brstitch::header::Header h;
    h.name = name;
    h.index = index;
    h.compressed = compressed;
    h.last = last;
    return h;
}

void TestScenarioA() {
    std::cout << "split 20000 bytes into 4096-byte payloads and stitch back" << std::endl;
    TempDir tmp;
    fs::create_directories(tmp / "in");
    Bytes original = SampleData(20000, 5);
    WriteBytes(tmp / "in" / "data.bin", original);

    Confirmer confirmer(ConfirmPolicy::AssumeNo);
    brstitch::SplitOptions options;
    options.section_size = 4096 + 128;
    options.compress = false;
    options.output_dir = tmp / "sections";
    auto result = brstitch::SplitFile(tmp / "in" / "data.bin", options, confirmer);

    Check(result.sections.size() == 5, "five section files");
    bool sizes_ok = true;
    for (const auto& section : result.sections) {
        sizes_ok = sizes_ok && fs::file_size(section) <= 4096 + 128;
    }
    Check(sizes_ok, "every section within 4224 bytes");
    Check(result.sections.front().filename() == "data_0.brs" && result.sections.back().filename() == "data_4.brs",
          "sections named <stem>_<index>.brs");

    Bytes last_file = ReadBytes(result.sections.back());
    auto last = brstitch::header::Decode(last_file.data(), 128);
    Check(last.last && last.index == 4 && last.name == "data.bin" && !last.compressed, "final section flagged LAST");
    Bytes first_file = ReadBytes(result.sections.front());
    Check(!brstitch::header::Decode(first_file.data(), 128).last, "first section not LAST");

    brstitch::StitchOptions stitch_options;
    stitch_options.output_dir = tmp / "out";
    auto summary = brstitch::StitchFiles({tmp / "sections"}, stitch_options, confirmer);
    Check(summary.outputs.size() == 1 && summary.failed.empty(), "one file stitched");
    Check(ReadBytes(tmp / "out" / "data.bin") == original, "stitched bytes equal the original");
    Check(SectionFilesIn(tmp / "sections").empty(), "sections removed after stitching");
    Check(fs::exists(tmp / "in" / "data.bin"), "original kept without delete_original");
}

void TestRoundTrips() {
    std::cout << "round trips" << std::endl;
    for (bool compress : {false, true}) {
        for (std::size_t size : {0u, 1u, 127u, 4096u, 100000u}) {
            for (std::size_t section : {129u, 1000u, 65536u}) {
                if (size / (section - 128) > 500) {
                    continue;
                }
                TempDir tmp;
                Bytes original = SampleData(size, static_cast<std::uint32_t>(size + section));
                fs::path input = tmp / "my file.dat";
                WriteBytes(input, original);

                Confirmer confirmer(ConfirmPolicy::AssumeNo);
                brstitch::SplitOptions options;
                options.section_size = section;
                options.compress = compress;
                options.nest = section == 1000;
                options.delete_original = true;
                options.chunk_size = 777;
                options.output_dir = tmp / "sec";
                auto result = brstitch::SplitFile(input, options, confirmer);

                brstitch::StitchOptions stitch_options;
                stitch_options.output_dir = tmp / "out";
                stitch_options.keep_sections = true;
                std::vector<fs::path> sources = {result.directory ? *result.directory : tmp / "sec"};
                auto summary = brstitch::StitchFiles(sources, stitch_options, confirmer);

                std::string label = "size=" + std::to_string(size) + " section=" + std::to_string(section)
                                    + " compress=" + std::to_string(compress);
                Check(!fs::exists(input) && summary.outputs.size() == 1
                          && ReadBytes(tmp / "out" / "my file.dat") == original,
                      label);
                if (options.nest) {
                    Check(result.directory && result.directory->filename() == "my_file_sections"
                              && result.sections.front().filename() == "my_file_0.brs",
                          "nested names sanitize spaces");
                }
                Check(SectionFilesIn(tmp / "sec").size() == result.sections.size(), "keep_sections leaves sections");
            }
        }
    }
}

void TestScenarioB() {
    std::cout << "missing first section" << std::endl;
    brstitch::registry::SectionRegistry registry;
    registry.Add("x_1.brs", Hdr("x.txt", 1, false, true));
    auto reports = registry.Resolve();
    Check(reports.size() == 1 && reports[0].name == "x.txt", "one group");
    const auto& report = reports[0];
    Check(report.Has(GroupCondition::Incomplete) && !report.Stitchable(), "incomplete group not stitchable");
    Check(report.count && *report.count == 2, "count resolved from LAST");
    Check(report.missing == std::vector<std::uint32_t>{0} && report.missing_total == 1, "index 0 reported missing");

    Confirmer decline(ConfirmPolicy::AssumeNo);
    Check(Throws<brstitch::GroupRejected>([&] { brstitch::validate::Review(report, decline); }),
          "declining the problem aborts");
    Confirmer accept(ConfirmPolicy::AssumeYes);
    Check(!brstitch::validate::Review(report, accept).has_value(), "ignoring the problem skips the group");

    TempDir tmp;
    WriteSection(tmp / "x_1.brs", "x.txt", 1, false, true, {'h', 'i'});
    brstitch::StitchOptions options;
    options.output_dir = tmp / "out";
    auto summary = brstitch::StitchFiles({tmp.path()}, options, accept);
    Check(summary.skipped == std::vector<std::string>{"x.txt"} && summary.outputs.empty(), "group skipped");
    Check(!fs::exists(tmp / "out" / "x.txt"), "no stitch ran");
    Check(fs::exists(tmp / "x_1.brs"), "skipped sections untouched");
}

void TestNoLast() {
    std::cout << "no LAST section" << std::endl;
    brstitch::registry::SectionRegistry registry;
    registry.Add("a", Hdr("n.bin", 0, false, false));
    registry.Add("b", Hdr("n.bin", 2, false, false));
    auto report = registry.Resolve().front();
    Check(!report.count && report.Has(GroupCondition::Incomplete), "unresolved count is incomplete");
    Check(report.missing == std::vector<std::uint32_t>{1}, "gap below highest index reported");
}

void TestScenarioC() {
    std::cout << "inconsistent compression" << std::endl;
    brstitch::registry::SectionRegistry registry;
    registry.Add("y_0.brs", Hdr("y.bin", 0, false, false));
    registry.Add("y_1.brs", Hdr("y.bin", 1, true, false));
    registry.Add("y_2.brs", Hdr("y.bin", 2, false, true));
    auto report = registry.Resolve().front();
    Check(report.Has(GroupCondition::Inconsistent), "InconsistentGroup reported");
    Check(!report.Stitchable(), "inconsistent group not stitchable");
    Check(report.compressed_paths == std::vector<fs::path>{"y_1.brs"}, "compressed member identified");
    Confirmer decline(ConfirmPolicy::AssumeNo);
    bool rejected_with_condition = false;
    try {
        brstitch::validate::Review(report, decline);
    } catch (const brstitch::GroupRejected& exc) {
        rejected_with_condition = exc.name() == "y.bin"
            && exc.conditions() == std::vector<GroupCondition>{GroupCondition::Inconsistent};
    }
    Check(rejected_with_condition, "rejection carries the condition");
}

void TestEarliestLastWins() {
    std::cout << "earliest LAST wins" << std::endl;
    brstitch::registry::SectionRegistry registry;
    for (std::uint32_t i = 0; i < 10; ++i) {
        registry.Add("z_" + std::to_string(i) + ".brs", Hdr("z", i, true, i == 5 || i == 8));
    }
    auto report = registry.Resolve().front();
    Check(report.count && *report.count == 6, "count is 6");
    Check(report.Has(GroupCondition::Excess) && report.excess.size() == 4, "indices 6..9 excess");
    Check(report.Stitchable(), "excess alone does not block");
    Check(report.plan.count == 6 && report.plan.sections.size() == 6 && report.plan.compressed, "plan covers [0, 6)");

    Confirmer decline(ConfirmPolicy::AssumeNo);
    Check(Throws<brstitch::GroupRejected>([&] { brstitch::validate::Review(report, decline); }),
          "declining excess aborts");
    Confirmer accept(ConfirmPolicy::AssumeYes);
    auto plan = brstitch::validate::Review(report, accept);
    Check(plan && plan->sections.rbegin()->first == 5, "accepted plan excludes excess");
}

void TestDuplicates() {
    std::cout << "duplicate sections" << std::endl;
    brstitch::registry::SectionRegistry registry;
    registry.Add("d_0a.brs", Hdr("d", 0, false, false));
    registry.Add("d_0b.brs", Hdr("d", 0, false, false));
    registry.Add("d_1.brs", Hdr("d", 1, false, true));
    auto report = registry.Resolve().front();
    Check(report.Has(GroupCondition::Duplicate) && !report.Stitchable(), "duplicate blocks the group");
    Check(report.duplicates.size() == 1 && report.duplicates.at(0).size() == 2, "both claimants listed");
    Check(!report.Has(GroupCondition::Incomplete), "duplicate is not a gap");
}

void TestOrderIndependence() {
    std::cout << "order independence" << std::endl;
    struct Entry {
        std::string path;
        brstitch::header::Header header;
    };
    std::vector<Entry> entries = {
        {"a0", Hdr("a", 0, true, false)}, {"a1", Hdr("a", 1, true, false)}, {"a2", Hdr("a", 2, true, true)},
        {"a3", Hdr("a", 3, true, true)},  {"b0", Hdr("b", 0, false, false)}, {"b0x", Hdr("b", 0, false, false)},
        {"b1", Hdr("b", 1, true, true)},  {"c2", Hdr("c", 2, false, true)},  {"c0", Hdr("c", 0, false, false)},
    };
    auto summarize = [](const std::vector<brstitch::registry::GroupReport>& reports) {
        std::ostringstream out;
        for (const auto& r : reports) {
            out << r.name << ":" << (r.count ? std::to_string(*r.count) : "-") << ":";
            for (auto c : r.conditions) {
                out << brstitch::ConditionName(c) << ",";
            }
            for (auto m : r.missing) {
                out << m << ",";
            }
            for (const auto& e : r.excess) {
                out << e.string() << ",";
            }
            for (const auto& [i, p] : r.plan.sections) {
                out << i << "=" << p.string() << ",";
            }
            out << r.plan.compressed << ";";
        }
        return out.str();
    };

    brstitch::registry::SectionRegistry reference;
    for (const auto& e : entries) {
        reference.Add(e.path, e.header);
    }
    const std::string expected = summarize(reference.Resolve());

    std::mt19937 gen(1234);
    bool same = true;
    for (int round = 0; round < 50; ++round) {
        std::shuffle(entries.begin(), entries.end(), gen);
        brstitch::registry::SectionRegistry shuffled;
        for (const auto& e : entries) {
            shuffled.Add(e.path, e.header);
        }
        same = same && summarize(shuffled.Resolve()) == expected;
    }
    Check(same, "reports identical for 50 scan orders");
}

void TestScenarioD() {
    std::cout << "interrupted split leaves nothing behind" << std::endl;
    for (bool nest : {false, true}) {
        TempDir tmp;
        WriteBytes(tmp / "big.bin", SampleData(20000, 9));
        Confirmer confirmer(ConfirmPolicy::AssumeNo);
        brstitch::SplitOptions options;
        options.section_size = 4096 + 128;
        options.compress = false;
        options.nest = nest;
        options.output_dir = tmp / "sec";
        int written = 0;
        options.on_section = [&written](const fs::path&) {
            if (++written == 3) {
                throw std::runtime_error("disk full");
            }
        };
        bool threw = Throws<std::runtime_error>([&] { brstitch::SplitFile(tmp / "big.bin", options, confirmer); });
        Check(threw && written == 3, std::string("failure after 3 of 5 sections propagates, nest=") + (nest ? "1" : "0"));
        Check(SectionFilesIn(tmp.path()).empty(), "zero section files remain");
        Check(!fs::exists(tmp / "sec" / "big_sections"), "nest directory removed");
        Check(fs::exists(tmp / "big.bin"), "input untouched");
    }

    TempDir tmp;
    WriteBytes(tmp / "big.bin", SampleData(20000, 9));
    Confirmer confirmer(ConfirmPolicy::AssumeNo);
    brstitch::SplitOptions options;
    options.section_size = 4096 + 128;
    options.compress = false;
    options.delete_original = true;
    int written = 0;
    options.output_dir = tmp / "sec";
    options.on_section = [&written](const fs::path&) {
        if (++written == 2) {
            brstitch::interrupt::Request();
        }
    };
    bool interrupted = Throws<brstitch::OperationInterrupted>(
        [&] { brstitch::SplitFile(tmp / "big.bin", options, confirmer); });
    brstitch::interrupt::Clear();
    Check(interrupted, "pending interrupt stops the split");
    Check(SectionFilesIn(tmp.path()).empty() && fs::exists(tmp / "big.bin"), "interrupted split cleaned up");
}

void TestSectionUnavailable() {
    std::cout << "section vanishes before stitching" << std::endl;
    TempDir tmp;
    Bytes original = SampleData(5000, 3);
    WriteBytes(tmp / "v.bin", original);
    Confirmer confirmer(ConfirmPolicy::AssumeNo);
    brstitch::SplitOptions options;
    options.section_size = 1128;
    options.output_dir = tmp.path();
    auto result = brstitch::SplitFile(tmp / "v.bin", options, confirmer);

    brstitch::registry::SectionRegistry registry;
    registry.ScanAll(result.sections);
    auto plan = brstitch::validate::Review(registry.Resolve().front(), confirmer);
    Check(plan.has_value() && plan->count == result.sections.size(), "group validated");

    fs::remove(result.sections[1]);
    fs::path output = tmp / "restored.bin";
    bool unavailable = Throws<brstitch::SectionUnavailable>(
        [&] { brstitch::StitchToFile(*plan, output, 4096, confirmer); });
    Check(unavailable, "SectionUnavailable raised");
    Check(!fs::exists(output), "partial output deleted");
}

void TestFailureIsolation() {
    std::cout << "one broken group does not stop the others" << std::endl;
    TempDir tmp;
    WriteSection(tmp / "good_0.brs", "good.txt", 0, false, false, {'a', 'b'});
    WriteSection(tmp / "good_1.brs", "good.txt", 1, false, true, {'c'});
    // Compressed flag on a payload that is not a deflate stream.
    WriteSection(tmp / "bad_0.brs", "bad.txt", 0, true, true, {'n', 'o', 'p', 'e'});

    Confirmer confirmer(ConfirmPolicy::AssumeNo);
    brstitch::StitchOptions options;
    options.output_dir = tmp / "out";
    auto summary = brstitch::StitchFiles({tmp.path()}, options, confirmer);
    Check(summary.failed.size() == 1 && summary.failed[0].first == "bad.txt", "corrupt group reported as failed");
    Check(summary.outputs.size() == 1 && ReadBytes(tmp / "out" / "good.txt") == Bytes({'a', 'b', 'c'}),
          "healthy group stitched");
    Check(!fs::exists(tmp / "out" / "bad.txt"), "failed output removed");
    Check(fs::exists(tmp / "bad_0.brs"), "sections of failed group kept");
}

void TestInvalidCandidates() {
    std::cout << "invalid candidates" << std::endl;
    TempDir tmp;
    WriteBytes(tmp / "junk.brs", SampleData(300, 1));
    WriteBytes(tmp / "short.brs", Bytes(10, 0));
    WriteBytes(tmp / "notes.txt", Bytes(200, 'x'));
    WriteSection(tmp / "ok_0.brs", "ok.txt", 0, false, true, {'z'});

    brstitch::registry::SectionRegistry registry;
    registry.ScanAll(brstitch::fileio::CollectCandidates({tmp.path()}));
    Check(registry.Invalid().size() == 2, "bad magic and short file rejected, other extensions ignored");
    Check(registry.GroupCount() == 1, "valid section still grouped");

    Check(!registry.Scan(tmp / "missing.brs") && registry.Invalid().back().reason == "file does not exist",
          "missing candidate is recoverable");

    Confirmer decline(ConfirmPolicy::AssumeNo);
    brstitch::StitchOptions options;
    options.output_dir = tmp / "out";
    Check(Throws<std::runtime_error>([&] { brstitch::StitchFiles({tmp.path()}, options, decline); }),
          "declining an invalid candidate aborts");
    Confirmer accept(ConfirmPolicy::AssumeYes);
    auto summary = brstitch::StitchFiles({tmp.path()}, options, accept);
    Check(summary.outputs.size() == 1 && ReadBytes(tmp / "out" / "ok.txt") == Bytes({'z'}),
          "ignoring invalid candidates stitches the rest");
}

void TestExcessOnDisk() {
    std::cout << "unneeded sections on disk" << std::endl;
    TempDir tmp;
    WriteSection(tmp / "e_0.brs", "e.txt", 0, false, false, {'1'});
    WriteSection(tmp / "e_1.brs", "e.txt", 1, false, true, {'2'});
    WriteSection(tmp / "e_2.brs", "e.txt", 2, false, true, {'3'});
    Confirmer accept(ConfirmPolicy::AssumeYes);
    brstitch::StitchOptions options;
    options.output_dir = tmp / "out";
    auto summary = brstitch::StitchFiles({tmp.path()}, options, accept);
    Check(summary.outputs.size() == 1 && ReadBytes(tmp / "out" / "e.txt") == Bytes({'1', '2'}),
          "stitch ignores the excess section");
    Check(fs::exists(tmp / "e_2.brs") && !fs::exists(tmp / "e_0.brs"), "only consumed sections deleted");
}

void TestOutputNameConfined() {
    std::cout << "stored names cannot escape the output directory" << std::endl;
    TempDir tmp;
    WriteSection(tmp / "p_0.brs", "../../escape.txt", 0, false, true, {'!'});
    Confirmer confirmer(ConfirmPolicy::AssumeNo);
    brstitch::StitchOptions options;
    options.output_dir = tmp / "out";
    brstitch::StitchFiles({tmp / "p_0.brs"}, options, confirmer);
    Check(fs::exists(tmp / "out" / "escape.txt") && !fs::exists(tmp.path().parent_path() / "escape.txt"),
          "only the file name component is used");
}

void TestNonUtf8NameRejected() {
    std::cout << "file name that is not UTF-8 is refused before writing" << std::endl;
    TempDir tmp;
    fs::path input = tmp.path() / std::string("caf\xE9.txt");
    WriteBytes(input, SampleData(1000, 8));
    Confirmer confirmer(ConfirmPolicy::AssumeYes);
    brstitch::SplitOptions options;
    options.section_size = 200;
    options.delete_original = true;
    options.output_dir = tmp / "sec";
    Check(Throws<std::runtime_error>([&] { brstitch::SplitFile(input, options, confirmer); }), "split refused");
    Check(SectionFilesIn(tmp.path()).empty(), "no sections left on disk");
    Check(fs::exists(input), "original kept");
}

void TestRepeatedArgument() {
    std::cout << "a section reached twice counts once" << std::endl;
    TempDir tmp;
    Bytes original = SampleData(3000, 12);
    WriteBytes(tmp / "x.txt", original);
    Confirmer confirmer(ConfirmPolicy::AssumeNo);
    brstitch::SplitOptions options;
    options.section_size = 1128;
    options.compress = false;
    options.output_dir = tmp / "sec";
    auto result = brstitch::SplitFile(tmp / "x.txt", options, confirmer);
    Check(result.sections.size() == 3, "three sections");

    fs::path again = tmp / "sec" / "." / result.sections[0].filename();
    auto candidates = brstitch::fileio::CollectCandidates({tmp / "sec", result.sections[0], again});
    Check(candidates.size() == result.sections.size(), "candidates listed once");

    brstitch::StitchOptions stitch_options;
    stitch_options.output_dir = tmp / "out";
    auto summary = brstitch::StitchFiles({tmp / "sec", result.sections[0]}, stitch_options, confirmer);
    Check(summary.outputs.size() == 1 && summary.failed.empty() && summary.skipped.empty(), "group stitched");
    Check(ReadBytes(tmp / "out" / "x.txt") == original, "stitched bytes equal the original");
}

void TestSplitFileReadChunk() {
    std::cout << "split file output independent of read chunk size" << std::endl;
    TempDir tmp;
    WriteBytes(tmp / "c.bin", SampleData(9000, 21));
    Confirmer confirmer(ConfirmPolicy::AssumeNo);
    std::vector<std::vector<Bytes>> runs;
    for (std::size_t chunk : {std::size_t{1}, std::size_t{7}, std::size_t{65536}}) {
        brstitch::SplitOptions options;
        options.section_size = 428;
        options.compress = false;
        options.chunk_size = chunk;
        options.output_dir = tmp / ("sec" + std::to_string(chunk));
        auto result = brstitch::SplitFile(tmp / "c.bin", options, confirmer);
        Check(result.input_bytes == 9000, "input bytes counted with chunk " + std::to_string(chunk));
        std::vector<Bytes> files;
        for (const auto& section : result.sections) {
            files.push_back(ReadBytes(section));
        }
        runs.push_back(files);
    }
    Check(runs[0] == runs[1] && runs[1] == runs[2], "identical sections for every chunk size");
}

void TestConfirmer() {
    std::cout << "confirmation policy" << std::endl;
    std::ostringstream sink;
    std::istringstream answers("\n  \nmaybe\n");
    Confirmer asker(ConfirmPolicy::Ask, answers, sink);
    Check(!asker.Confirm("continue?"), "blank lines re-prompt, other answers decline");
    Check(sink.str().find("Canceled.") != std::string::npos, "decline is announced");

    std::istringstream yes("y\n");
    Confirmer once(ConfirmPolicy::Ask, yes, sink);
    Check(once.Confirm("q?") && once.Policy() == ConfirmPolicy::Ask, "'y' accepts once");
    Check(!once.Confirm("q?"), "end of input declines");

    std::istringstream all("A\n");
    Confirmer always(ConfirmPolicy::Ask, all, sink);
    Check(always.Confirm("q?") && always.Policy() == ConfirmPolicy::AssumeYes, "'a' switches to assume-yes");
    Check(always.Confirm("again?"), "later questions answered yes without input");

    std::istringstream closed("");
    Confirmer interrupted(ConfirmPolicy::Ask, closed, sink);
    brstitch::interrupt::Request();
    Check(Throws<brstitch::OperationInterrupted>([&] { interrupted.Confirm("q?"); }),
          "interrupt during a prompt aborts instead of declining");
    brstitch::interrupt::Clear();

    TempDir tmp;
    WriteBytes(tmp / "exists.bin", {1});
    Confirmer no(ConfirmPolicy::AssumeNo);
    Check(Throws<std::runtime_error>([&] { brstitch::fileio::OpenForWrite(tmp / "exists.bin", no); }),
          "existing file not overwritten without consent");
    Check(ReadBytes(tmp / "exists.bin") == Bytes({1}), "existing file intact");
    Check(!brstitch::fileio::OpenForRead(tmp / "absent.bin").has_value(), "absent file reported as nullopt");

    Confirmer skip_missing(ConfirmPolicy::AssumeYes);
    brstitch::SplitOptions options;
    auto result = brstitch::SplitFile(tmp / "absent.bin", options, skip_missing);
    Check(result.skipped && result.sections.empty(), "missing split input skipped when ignored");
    Check(Throws<std::runtime_error>([&] { brstitch::SplitFile(tmp / "absent.bin", options, no); }),
          "missing split input fatal when not ignored");
}

void TestParseSize() {
    std::cout << "size parsing" << std::endl;
    Check(brstitch::ParseSize("8MB") == (8u << 20), "8MB");
    Check(brstitch::ParseSize("1.5kb") == 1536, "1.5kb");
    Check(brstitch::ParseSize("200b") == 200, "200b");
    Check(brstitch::ParseSize("4096") == 4096, "bare bytes");
    Check(brstitch::ParseSize("1gb") == (1ull << 30), "1gb");
    Check(Throws<std::invalid_argument>([] { brstitch::ParseSize("12xb"); }), "unknown unit rejected");
    Check(Throws<std::invalid_argument>([] { brstitch::ParseSize("mb"); }), "missing number rejected");
    Check(Throws<std::invalid_argument>([] { brstitch::ParseSize("17179869184gb"); }), "2^64 bytes rejected");

    brstitch::SplitOptions options;
    options.section_size = 128;
    Confirmer confirmer(ConfirmPolicy::AssumeNo);
    Check(Throws<std::invalid_argument>([&] { brstitch::SplitFile("whatever", options, confirmer); }),
          "section size must exceed the header");
}

}  // namespace

int main() {
    std::ostringstream quiet_out;
    std::ostringstream quiet_err;
    brstitch::log::SetStreams(&quiet_out, &quiet_err);

    TestScenarioA();
    TestRoundTrips();
    TestScenarioB();
    TestNoLast();
    TestScenarioC();
    TestEarliestLastWins();
    TestDuplicates();
    TestOrderIndependence();
    TestScenarioD();
    TestSectionUnavailable();
    TestFailureIsolation();
    TestInvalidCandidates();
    TestExcessOnDisk();
    TestOutputNameConfined();
    TestNonUtf8NameRejected();
    TestRepeatedArgument();
    TestSplitFileReadChunk();
    TestConfirmer();
    TestParseSize();

    brstitch::log::SetStreams(nullptr, nullptr);
    if (g_failures != 0) {
        std::cout << g_failures << " check(s) failed" << std::endl;
        return 1;
    }
    std::cout << "all checks passed" << std::endl;
    return 0;
}

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include <recordflow/recordflow.hpp>

// ---------------------------------------------------------------------------
// Record dump utility
// ---------------------------------------------------------------------------
// Reads files through the same dataset and iterator path an application
// would use and prints every element on its own line. Batches are printed as
// their records joined by tabs. Useful for checking that a file is readable
// with a given format and compression before wiring it into a pipeline.
// ---------------------------------------------------------------------------

using namespace recordflow;

namespace {

void usage() {
    std::cerr << "Usage: recordflow_cat (--text|--framed|--fixed R[:H[:F]]) [--compression T]\n"
              << "                      [--buffer-size N] [--epochs N] [--batch N] [--count]\n"
              << "                      <files...>\n";
}

/// Parse "R[:H[:F]]" into record, header and footer sizes.
std::vector<std::int64_t> parse_fixed_sizes(const std::string& sizes) {
    std::vector<std::int64_t> out;
    std::size_t start = 0;
    while (start <= sizes.size()) {
        auto end = sizes.find(':', start);
        if (end == std::string::npos)
            end = sizes.size();
        out.push_back(std::stoll(sizes.substr(start, end - start)));
        start = end + 1;
    }
    if (out.empty() || out.size() > 3)
        throw InvalidArgumentError("invalid fixed length sizes '" + sizes + "'");
    out.resize(3, 0);
    return out;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        usage();
        return 1;
    }
    std::string mode;
    std::string compression;
    std::string fixed;
    std::int64_t buffer_size = static_cast<std::int64_t>(default_buffer_size());
    std::int64_t epochs = 1;
    std::int64_t batch = 0;
    bool count_only = false;
    std::vector<std::string> files;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--text" || arg == "--framed") {
                mode = arg;
            } else if (arg == "--fixed" && i + 1 < argc) {
                mode = arg;
                fixed = argv[++i];
            } else if (arg == "--compression" && i + 1 < argc) {
                compression = argv[++i];
            } else if (arg == "--buffer-size" && i + 1 < argc) {
                buffer_size = std::stoll(argv[++i]);
            } else if (arg == "--epochs" && i + 1 < argc) {
                epochs = std::stoll(argv[++i]);
            } else if (arg == "--batch" && i + 1 < argc) {
                batch = std::stoll(argv[++i]);
            } else if (arg == "--count") {
                count_only = true;
            } else if (arg == "--version") {
                std::cout << version_string() << '\n';
                return 0;
            } else if (!arg.empty() && arg[0] == '-') {
                std::cerr << "Unknown option " << arg << '\n';
                usage();
                return 1;
            } else {
                files.push_back(arg);
            }
        }
        if (mode.empty() || files.empty()) {
            usage();
            return 1;
        }

        // Run-time settings are bound through placeholders at initialize.
        auto filenames = placeholder<std::vector<std::string>>("filenames");
        auto comp = placeholder_with_default<std::string>("compression_type", "");
        auto buf = placeholder_with_default<std::int64_t>("buffer_size", buffer_size);
        DatasetPtr ds;
        if (mode == "--text") {
            ds = text_line_dataset(filenames, comp, buf);
        } else if (mode == "--framed") {
            ds = framed_record_dataset(filenames, comp, buf);
        } else {
            auto sizes = parse_fixed_sizes(fixed);
            ds = fixed_length_record_dataset(filenames, sizes[0], sizes[1], sizes[2], buf, comp);
        }
        ds = ds->repeat(placeholder<std::int64_t>("num_epochs"));
        if (batch > 0)
            ds = ds->batch(placeholder<std::int64_t>("batch_size"));

        FeedDict feed{{"filenames", files},
                      {"compression_type", compression},
                      {"num_epochs", epochs},
                      {"batch_size", batch}};
        Iterator it = Iterator::from_structure(ds->output_types());
        it.initialize(ds, feed);

        std::size_t count = 0;
        while (true) {
            Value v;
            try {
                v = it.get_next();
            } catch (const OutOfRangeError&) {
                break;
            }
            ++count;
            if (count_only)
                continue;
            const auto& recs = v.data();
            for (std::size_t i = 0; i < recs.size(); ++i) {
                if (i > 0)
                    std::cout << '\t';
                std::cout << recs[i];
            }
            std::cout << '\n';
        }
        if (count_only)
            std::cout << count << '\n';
    } catch (const std::exception& e) {
        std::cerr << e.what() << '\n';
        return 1;
    }
    return 0;
}

#include <iostream>
#include <string>
#include <vector>

#include <recordflow/recordflow.hpp>

// ---------------------------------------------------------------------------
// Text to framed record conversion utility
// ---------------------------------------------------------------------------
// Reads every line of one or more text files (optionally compressed) and
// writes each line as a framed record. The output can then be read back with
// FramedRecordDataset or `recordflow_cat --framed`.
// ---------------------------------------------------------------------------

using namespace recordflow;

int main(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "Usage: recordflow_convert <in.txt>... -o <out.rec> [--compression T]"
                     " [--input-compression T]\n";
        return 1;
    }
    std::vector<std::string> inputs;
    std::string out;
    std::string compression;
    std::string input_compression;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-o" || arg == "--out") && i + 1 < argc)
            out = argv[++i];
        else if (arg == "--compression" && i + 1 < argc)
            compression = argv[++i];
        else if (arg == "--input-compression" && i + 1 < argc)
            input_compression = argv[++i];
        else
            inputs.push_back(arg);
    }
    if (out.empty() || inputs.empty()) {
        std::cerr << "Both an input and -o <out.rec> are required\n";
        return 1;
    }

    try {
        Iterator it = Iterator::one_shot(text_line_dataset(inputs, input_compression));
        FramedRecordWriter writer(out, parse_compression_type(compression));
        while (true) {
            Value v;
            try {
                v = it.get_next();
            } catch (const OutOfRangeError&) {
                break;
            }
            writer.write(v.scalar());
        }
        // Close explicitly so a failed final flush is reported as an error.
        writer.close();
        std::cerr << "wrote " << writer.records_written() << " records to " << out << '\n';
    } catch (const std::exception& e) {
        std::cerr << e.what() << '\n';
        return 1;
    }
    return 0;
}

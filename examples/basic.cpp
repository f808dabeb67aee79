#include <iostream>
#include <recordflow/recordflow.hpp>
#include <string>
#include <vector>

// Writes a small framed record file and reads it back in batches of two.
int main() {
    using namespace recordflow;
    {
        FramedRecordWriter writer("example.rec");
        for (int i = 0; i < 5; ++i)
            writer.write("record " + std::to_string(i));
    }
    auto files = placeholder<std::vector<std::string>>("filenames");
    auto ds = framed_record_dataset(files)->repeat(2)->batch(2);
    Iterator it = Iterator::from_structure(ds->output_types());
    it.initialize(ds, {{"filenames", std::vector<std::string>{"example.rec"}}});
    while (true) {
        Value batch;
        try {
            batch = it.get_next();
        } catch (const OutOfRangeError&) {
            break;
        }
        std::cout << "batch of " << batch.shape()[0] << ':';
        for (const auto& r : batch.data())
            std::cout << ' ' << r;
        std::cout << '\n';
    }
}

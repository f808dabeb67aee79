#include <chrono>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

#include <recordflow/recordflow.hpp>

using namespace recordflow;

static void write_sample(const std::string& path, std::size_t records, CompressionType type) {
    FramedRecordWriter writer(path, type);
    std::string payload(200, 'r');
    for (std::size_t i = 0; i < records; ++i) {
        payload.replace(0, 8, std::to_string(10000000 + i));
        writer.write(payload);
    }
    writer.close();
}

static double benchmark(const std::string& path, const std::string& compression,
                        std::int64_t buffer_size, std::size_t runs) {
    auto ds = framed_record_dataset(std::vector<std::string>{path}, compression, buffer_size);
    double total = 0.0;
    for (std::size_t i = 0; i < runs; ++i) {
        auto start = std::chrono::high_resolution_clock::now();
        Iterator it = Iterator::one_shot(ds);
        std::size_t n = 0;
        while (true) {
            try {
                it.get_next();
            } catch (const OutOfRangeError&) {
                break;
            }
            ++n;
        }
        auto end = std::chrono::high_resolution_clock::now();
        total += std::chrono::duration<double, std::milli>(end - start).count();
        if (n == 0)
            std::cerr << "no records read from " << path << '\n';
    }
    return total / static_cast<double>(runs);
}

int main(int argc, char** argv) {
    std::size_t records = argc > 1 ? std::stoul(argv[1]) : 100000;
    const std::size_t runs = 3;
    try {
        write_sample("bench_plain.rec", records, CompressionType::None);
        write_sample("bench_gzip.rec", records, CompressionType::Gzip);
        for (std::int64_t buf : {std::int64_t{4096}, std::int64_t{256 * 1024},
                                 std::int64_t{1 << 20}}) {
            std::cout << "buffer " << buf << " bytes: plain "
                      << benchmark("bench_plain.rec", "", buf, runs) << " ms, gzip "
                      << benchmark("bench_gzip.rec", "GZIP", buf, runs) << " ms\n";
        }
    } catch (const std::exception& e) {
        std::cerr << e.what() << '\n';
        return 1;
    }
    std::remove("bench_plain.rec");
    std::remove("bench_gzip.rec");
    return 0;
}

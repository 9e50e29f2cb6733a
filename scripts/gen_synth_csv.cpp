#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <string>
#include <vector>
#include <random>
#include <fstream>

#include <fmt/format.h>

// Writes a partitioned dataset: one CSV file per partition.
int main(int argc, char** argv){
  if (argc < 4){
    fmt::print(stderr, "usage: ddattr_gen_synth <out-dir> <partitions> <rows-per-partition>\n");
    return 2;
  }
  const std::filesystem::path out = argv[1];
  const std::uint64_t parts = std::strtoull(argv[2], nullptr, 10);
  const std::uint64_t rows  = std::strtoull(argv[3], nullptr, 10);

  std::error_code ec;
  std::filesystem::create_directories(out, ec);
  if (ec){ fmt::print(stderr, "mkdir failed: {} ({})\n", out.string(), ec.message()); return 2; }

  std::mt19937_64 rng(42);
  std::normal_distribution<double> dn(100.0, 15.0);
  std::uniform_int_distribution<int> dmiss(0, 19);
  std::uniform_int_distribution<long long> dts(1672531200LL, 1704067199LL); // 2023
  const char* groups[] = {"alpha","bravo","charlie","delta","echo","foxtrot"};

  std::uint64_t id = 0;
  for (std::uint64_t p=0;p<parts;++p){
    const auto file = out / fmt::format("part-{:05d}.csv", p);
    std::ofstream f(file, std::ios::binary);
    if (!f){ fmt::print(stderr, "open failed: {}\n", file.string()); return 2; }

    f << "id,value,group,ts,label\n";
    // every 7th partition is empty, every 5th is twice as large
    const std::uint64_t n = (p % 7 == 6) ? 0 : (p % 5 == 4 ? rows * 2 : rows);
    for (std::uint64_t i=0;i<n;++i){
      ++id;
      const bool miss_value = dmiss(rng) == 0;
      const bool miss_group = dmiss(rng) == 0;
      const bool miss_ts    = dmiss(rng) == 0;

      std::time_t t = static_cast<std::time_t>(dts(rng));
      std::tm tm{};
#if defined(_WIN32)
      gmtime_s(&tm, &t);
#else
      gmtime_r(&t, &tm);
#endif
      char tsbuf[32];
      std::strftime(tsbuf, sizeof(tsbuf), "%Y-%m-%d %H:%M:%S", &tm);

      f << id << ","
        << (miss_value ? std::string("NA") : fmt::format("{:.4f}", dn(rng))) << ","
        << (miss_group ? "" : groups[id % 6]) << ","
        << (miss_ts ? std::string("NA") : std::string(tsbuf)) << ","
        << "\"lbl " << (id % 997) << ", x\"\n";
    }
  }
  fmt::print(stderr, "wrote {} partitions to {}\n", parts, out.string());
  return 0;
}

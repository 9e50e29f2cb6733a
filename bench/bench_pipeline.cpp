#include "engine/update_attributes.hpp"
#include "exec/local_executor.hpp"
#include "io/dataset_loader.hpp"
#include "metrics/timers.hpp"
#include "util/log.hpp"
#include <fmt/format.h>
#include <string>
#include <string_view>
#include <filesystem>

using std::string;
namespace fs = std::filesystem;

int main(int argc, char** argv){
  // Supported:
  //   <dir> [workers]
  //   --data <dir> [--workers N]
  string dataPath;
  size_t workers = 0;

  for (int i=1;i<argc;++i){
    std::string_view a(argv[i]);
    if (a == "--data" && i+1<argc) {
      dataPath = argv[++i];
    } else if (a == "--workers" && i+1<argc) {
      workers = static_cast<size_t>(std::stoull(argv[++i]));
    } else if (dataPath.empty() && !a.empty() && a[0] != '-') {
      dataPath = string(a);
      if (i+1<argc && argv[i+1][0] != '-') workers = static_cast<size_t>(std::stoull(argv[++i]));
    }
  }

  if (dataPath.empty()){
    fmt::print(stderr,
      "usage:\n"
      "  ddattr_bench <dir> [workers]\n"
      "  ddattr_bench --data <dir> [--workers N]\n");
    return 2;
  }
  if (!fs::is_directory(dataPath)){
    fmt::print(stderr, "not a directory: {}\n", dataPath);
    return 2;
  }
  ddattr::log::set_quiet(true);

  ddattr::load_options lo;
  ddattr::wall_timer wl; wl.start();
  auto ds = ddattr::load_dataset_dir(dataPath, lo);
  wl.stop();

  ddattr::local_executor exec;
  ddattr::exec_config ec; ec.workers = workers;
  ddattr::wall_timer wt; wt.start();
  ddattr::update_attributes(ds, exec, {}, ddattr::estimate_object_size, ec);
  wt.stop();

  const auto rows = ds.attributes().n_row.value_or(0);
  const double secs = wt.ms()/1000.0;
  const double rps  = secs>0? (double(rows)/secs) : 0.0;

  fmt::print("bench_pipeline,dir={},partitions={},rows={},load_sec={:.3f},attrs_sec={:.3f},rows/s={:.0f}\n",
             dataPath, ds.partitions().size(), rows, wl.ms()/1000.0, secs, rps);
  return 0;
}

#include <compute/analyzer.h>
#include <fir/core_package.h>
#include <error/error.h>
#include <util/message.h>
#include <algorithm>
#include <cstring>
#include <exception>

std::string_view get_arg(int argc, const char *argv[], std::string_view argname, std::string_view on_fail) {
  auto it = std::find_if(argv, argv + argc, [argname](const char *p) { return std::strcmp(p, argname.data()) == 0; });
  if (it == argv + argc)return on_fail;
  if (it == argv + argc - 1)return on_fail;
  return it[1];
}

bool has_flag(int argc, const char *argv[], std::string_view flag) {
  return std::any_of(argv, argv + argc, [flag](const char *p) { return std::strcmp(p, flag.data()) == 0; });
}

int main(int argc, const char *argv[]) {
  std::string_view target_dir = get_arg(argc, argv, "-o", "");
  std::string_view item_name = get_arg(argc, argv, "-item", "");
  rca::compute::options opts;
  if (has_flag(argc, argv, "-trace"))opts.trace = &std::cerr;

  rca::fir::package_store store;
  const rca::fir::package_id core = store.insert(rca::fir::make_core_package());
  try {
    const rca::compute::store_compute_props result = rca::compute::analyze(store, rca::foundational::mapping(), opts);
    if (!item_name.empty()) {
      std::optional<rca::fir::local_item_id> item = store.get(core).find_callable(item_name);
      if (!item.has_value()) {
        util::message::error_string("no callable named " + std::string(item_name)).print(std::cerr);
        return 1;
      }
      result.get_callable(core, *item).print(std::cout, 0);
      std::cout << std::endl;
    } else if (!target_dir.empty()) {
      result.persist(target_dir);
    } else {
      result.print(std::cout);
    }
  } catch (const rca::error::base &e) {
    e.print(std::cerr);
    return 1;
  } catch (const std::exception &e) {
    util::message::internal_error_string(e.what()).print(std::cerr);
    return 1;
  }
  return 0;
}

#include "internal/aggregate/loader.hpp"

#include "config/config.pb.h"

namespace chatlog::aggregate {

LoaderOptions LoaderOptionsFromConfig(const chatlog::runtime::config::LoaderConfig& config) {
  LoaderOptions options;
  if (config.page_size() > 0) options.page_size = config.page_size();
  options.snapshot_every = config.snapshot_every();
  return options;
}

} // namespace chatlog::aggregate

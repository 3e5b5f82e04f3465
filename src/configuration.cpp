//
// Created by garrett on 2/23/25.
//

#include "configuration.hpp"

Configuration::Configuration()
    : cache_file(DEFAULT_CACHE_FILE),
      log_file(DEFAULT_LOG_FILE) {
}

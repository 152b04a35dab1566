#include "util/log.hpp"

namespace {

bool g_verbose = false;

}  // namespace

void
nestdiff::log_set_verbose(bool verbose) {
    g_verbose = verbose;
}

bool
nestdiff::log_verbose() {
    return g_verbose;
}

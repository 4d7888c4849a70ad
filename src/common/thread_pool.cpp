#include "cggmp/common/thread_pool.hpp"

#include <algorithm>
#include <cstdlib>

namespace cggmp {

size_t ResolveProofWorkerCount() {
  const char* env = std::getenv("CGGMP_PROOF_THREADS");
  if (env != nullptr && env[0] != '\0') {
    char* end = nullptr;
    const unsigned long parsed = std::strtoul(env, &end, 10);
    if (end != env && end != nullptr && *end == '\0' && parsed > 0) {
      return static_cast<size_t>(parsed);
    }
  }

  const unsigned int hw = std::thread::hardware_concurrency();
  return std::max<size_t>(1, hw == 0 ? 1 : hw);
}

ThreadPool& ProofThreadPool() {
  static ThreadPool pool(ResolveProofWorkerCount());
  return pool;
}

}  // namespace cggmp

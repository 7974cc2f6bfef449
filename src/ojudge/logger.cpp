#include <ojudge/logger.h>

#include <pthread.h>
#include <spdlog/spdlog.h>
#include <spdlog/details/console_globals.h>

namespace {

// every color console sink shares this mutex; holding it across fork keeps the child from
// inheriting it locked by a thread that no longer exists
void Prepare() {
  spdlog::details::console_mutex::mutex().lock();
}

void Parent() {
  spdlog::details::console_mutex::mutex().unlock();
}

void Child() {
  spdlog::details::console_mutex::mutex().unlock();
}

} // namespace

void InitLogger() {
  spdlog::debug("Setup logger pthread_atfork");
  pthread_atfork(Prepare, Parent, Child);
}

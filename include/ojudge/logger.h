#ifndef INCLUDE_OJUDGE_LOGGER_H_
#define INCLUDE_OJUDGE_LOGGER_H_

// Must be called before any thread forks a sandbox process
void InitLogger();

#endif  // INCLUDE_OJUDGE_LOGGER_H_

#ifndef LOG_H
#define LOG_H

#ifdef __EMSCRIPTEN__
  // WASM
  #include <emscripten/emscripten.h>
  #define SUDOPAR_LOG(fmt, ...) emscripten_log(EM_LOG_CONSOLE, fmt, ##__VA_ARGS__)
#else
  // native
  #include <cstdio>
  #define EMSCRIPTEN_KEEPALIVE
  #define SUDOPAR_LOG(fmt, ...) std::fprintf(stderr, "[sudopar] " fmt "\n", ##__VA_ARGS__)
#endif

//
// FOR DEBUGGING
// build with -DSUDOPAR_VERBOSE to trace fixpoint cycles and search branching
//
#ifdef SUDOPAR_VERBOSE
  #define SUDOPAR_DEBUG(fmt, ...) SUDOPAR_LOG(fmt, ##__VA_ARGS__)
#else
  #define SUDOPAR_DEBUG(fmt, ...) do { if (false) { SUDOPAR_LOG(fmt, ##__VA_ARGS__); } } while (0)
#endif

#endif // LOG_H

#pragma once

/*compile-time defaults; runtime overrides live in Settings (~/.fneditrc)*/

#ifndef FN_TAB_WIDTH
#define FN_TAB_WIDTH 4
#endif

#ifndef FN_LINE_INDEX_BLOCK_SIZE
#define FN_LINE_INDEX_BLOCK_SIZE 1024
#endif

#ifndef FN_WRITE_CHUNK_SIZE
#define FN_WRITE_CHUNK_SIZE (1 << 16)
#endif

#ifndef FN_RC_NAME
#define FN_RC_NAME ".fneditrc"
#endif

#ifndef FN_DEFAULT_LOG_PATH
#define FN_DEFAULT_LOG_PATH "/tmp/fnedit.log"
#endif

#ifndef FN_DEFAULT_LOG_LEVEL
#define FN_DEFAULT_LOG_LEVEL "info"
#endif

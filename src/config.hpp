#pragma once

/*here you can tune the board at build time, e.g. -DKB_TICK_MS=100*/

#ifndef KB_TICK_MS
#define KB_TICK_MS 250
#endif

/* log strip height, borders included */
#ifndef KB_LOG_ROWS
#define KB_LOG_ROWS 8
#endif

#ifndef KB_DETAIL_TEXT
#define KB_DETAIL_TEXT "Something important to do"
#endif

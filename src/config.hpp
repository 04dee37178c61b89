#pragma once

/* compile-time defaults; runtime overrides come from the rc file (options.hpp) */

#ifndef NVGRID_RC_NAME
#define NVGRID_RC_NAME ".nvgridrc"
#endif

#ifndef NVGRID_LOG_FILE
#define NVGRID_LOG_FILE "nvgrid.log"
#endif

// cursor timings (ms) used when the editor sent no mode info
#define NVGRID_DEFAULT_BLINKWAIT 0
#define NVGRID_DEFAULT_BLINKON   0
#define NVGRID_DEFAULT_BLINKOFF  0

// how long an unanswered resize request blocks the next one
#ifndef NVGRID_RESIZE_TIMEOUT_MS
#define NVGRID_RESIZE_TIMEOUT_MS 1000
#endif

#ifndef NVGRID_STEP_DELAY_MS
#define NVGRID_STEP_DELAY_MS 0
#endif

// largest grid the editor may ask for (cells, and per side); bigger sizes are ignored
#ifndef NVGRID_MAX_GRID_CELLS
#define NVGRID_MAX_GRID_CELLS (1 << 22)
#endif

// float z-index when win_float_pos omits it, and the message grid's
#define NVGRID_FLOAT_ZINDEX   50
#define NVGRID_MESSAGE_ZINDEX 200

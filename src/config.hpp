#pragma once

/*here you can change the default tab stop policy and demo settings*/

#ifndef ET_DEFAULT_MARGIN
#define ET_DEFAULT_MARGIN 1
#endif

#ifndef ET_DEFAULT_MIN_SIZE
#define ET_DEFAULT_MIN_SIZE 1
#endif

/* must be greater than 0 */
#ifndef ET_DEFAULT_STEP_SIZE
#define ET_DEFAULT_STEP_SIZE 1
#endif

#ifndef ET_DEFAULT_DELIMITER
#define ET_DEFAULT_DELIMITER '\t'
#endif

#ifndef ET_WRITE_CHUNK_SIZE
#define ET_WRITE_CHUNK_SIZE (64 * 1024)
#endif

#define ET_RC_FILE_NAME ".etdemorc"

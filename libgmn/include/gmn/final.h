/* gmn/final.h
 */
/* This software is copyrighted as detailed in the LICENSE file. */
#ifndef GMN_FINAL_H
#define GMN_FINAL_H

/* cleanup status for fast exits */

void              final_init();
[[noreturn]] void finalize(int status);

#endif

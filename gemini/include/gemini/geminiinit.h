/* geminiinit.h
 */
#ifndef GMN_GEMINIINIT_H
#define GMN_GEMINIINIT_H

void init_gemini();

#endif

/* gmn/gmn.h
 */
// This software is copyrighted as detailed in the LICENSE file.
#ifndef GMN_GMN_H
#define GMN_GMN_H

int gmn_main(int argc, char *argv[]);

#endif

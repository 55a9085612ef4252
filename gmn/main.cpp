/* This software is copyrighted as detailed in the LICENSE file. */

#include <gmn/gmn.h>

int main(int argc, char *argv[])
{
    return gmn_main(argc, argv);
}

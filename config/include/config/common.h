/* config/common.h
 */
// This software is copyrighted as detailed in the LICENSE file.
#ifndef GMN_COMMON_H
#define GMN_COMMON_H

enum
{
    GEMINI_PORT = 1965,      /* port assumed when the URL names none */
    GEMINI_MAX_META = 1024,  /* longest meta a server may send */
    GEMINI_MAX_REDIRECTS = 5 /* consecutive redirects before giving up */
};

#define GMN_VERSION "1.0"

#define GEMINI_SCHEME "gemini"
#define GEMINI_SCHEME_PREFIX "gemini://"

#define CONFIG_FILE_NAME "gmn.ini"
#define BOOKMARK_FILE_NAME "bookmarks"
#define CERT_DIR_NAME "certs"

#define DEFAULT_HOMEPAGE "gemini://geminiprotocol.net/"

#endif

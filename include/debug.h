
#ifndef DEBUG_H
#define DEBUG_H

/*
 Debug selectors follow the scheme of Philip Hazel's Exim Mail Transport Agent:
 -v turns on the default set, --vv everything, and -v+name / -v-name / -v=0xNN
 adjust individual bits.
 */

#include <string>

#define BIT(n) (1UL << (n))

enum {
    Di_archive = 0,
    Di_classify,
    Di_cleanup,
    Di_config,
    Di_exec,
    Di_lock,
    Di_mount,
    Di_scrub,
    Di_share,
    Di_signal,
    Di_volume,
};

#define D_archive     BIT(Di_archive)
#define D_classify    BIT(Di_classify)
#define D_cleanup     BIT(Di_cleanup)
#define D_config      BIT(Di_config)
#define D_exec        BIT(Di_exec)
#define D_lock        BIT(Di_lock)
#define D_mount       BIT(Di_mount)
#define D_scrub       BIT(Di_scrub)
#define D_share       BIT(Di_share)
#define D_signal      BIT(Di_signal)
#define D_volume      BIT(Di_volume)

#define D_all         0xffffffff

#define D_default     (D_all & \
                        ~(D_config   | \
                          D_exec     | \
                          D_lock     | \
                          D_mount))


#define DEBUG(x)      if (GLOBALS.debugSelector & (x))

struct bit_table {
    const char *name;
    unsigned int bit;
};

extern bit_table debug_options[];
extern int ndebug_options;

/* decode_bits()
 * Apply a selector string such as "+scrub-exec" or "=0x41" to 'selector'.
 * Returns an empty string on success or a description of the first
 * unrecognized item. */
std::string decode_bits(unsigned int &selector, std::string parsestring);

#endif


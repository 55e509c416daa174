/**
 * The STATS module tracks memory usage at the level of the custom memory allocator, which provides the capability
 * of tracking memory usage per parse or per query. We call jqrstats_begin_track_mem() and jqrstats_end_track_mem()
 * at the beginning and end of an operation respectively, to calculate the delta of the memory usage.
 *
 * The module also maintains the following counters:
 *    used memory: total memory allocated to JSON values
 *    query outcomes: number of queries per normalized outcome (invalid, empty, singular, plural)
 *    max depth and max size of the documents seen so far
 *    histograms of input document sizes and output value sizes
 */
#ifndef JQR_STATS_H_
#define JQR_STATS_H_

#include <stddef.h>
#include <stdint.h>

typedef enum {
    JQRSTATS_INVALID = 0,
    JQRSTATS_EMPTY,
    JQRSTATS_SINGULAR,
    JQRSTATS_PLURAL,
    JQRSTATS_NUM_OUTCOMES
} JqrQueryOutcome;

/* Reset all statistics counters. */
void jqrstats_init();

/* Begin tracking memory usage.
 * @return value of the thread local counter.
*/
int64_t jqrstats_begin_track_mem();

/* End tracking memory usage.
 * @param begin_val - previous saved thread local value that is returned from jqrstats_begin_track_mem().
 * @return delta of used memory
 */
int64_t jqrstats_end_track_mem(const int64_t begin_val);

/* Get the total memory allocated to JSON values. */
unsigned long long jqrstats_get_used_mem();

/* The following two methods are invoked by the DOM memory allocator upon every malloc/free/realloc.
 * Two memory counters are updated: A global atomic counter and a thread local counter (per thread).
 */
void jqrstats_increment_used_mem(size_t delta);
void jqrstats_decrement_used_mem(size_t delta);

unsigned long long jqrstats_get_max_depth_ever_seen();
void jqrstats_update_max_depth_ever_seen(const size_t max_depth);
unsigned long long jqrstats_get_max_size_ever_seen();
void jqrstats_update_max_size_ever_seen(const size_t max_size);

unsigned long long jqrstats_get_query_count(JqrQueryOutcome outcome);

// updating stats on parse and query
void jqrstats_update_stats_on_parse(const size_t doc_size, const size_t depth);
void jqrstats_update_stats_on_query(JqrQueryOutcome outcome);
void jqrstats_update_stats_on_output(const size_t output_size);

// helper methods for printing histograms into C string
void jqrstats_sprint_hist_buckets(char *buf, const size_t buf_size);
void jqrstats_sprint_doc_hist(char *buf, const size_t buf_size);
void jqrstats_sprint_output_hist(char *buf, const size_t buf_size);

/* Write all counters and histograms to the log at debug level. */
void jqrstats_log_summary();

/* Given a size (bytes), find the histogram bucket index using binary search.
 */
uint32_t jqrstats_find_bucket(size_t size);

#endif  // JQR_STATS_H_

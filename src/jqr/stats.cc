#include "jqr/stats.h"
#include "jqr/util.h"
#include <cstring>
#include <atomic>
#include <string>
#include <sstream>

#define STATIC /* decorator for static functions, remove so that backtrace symbols include these */

// Thread local counter for calculating used memory per thread.
static thread_local int64_t thread_local_mem_counter = 0;

/* jqr statistics struct.
 * Use atomic integers so that concurrent queries on independent documents need no coordination.
 */
typedef struct {
    std::atomic_ullong used_mem;  // global used memory counter
    std::atomic_ullong max_depth_ever_seen;
    std::atomic_ullong max_size_ever_seen;
    std::atomic_ullong query_count[JQRSTATS_NUM_OUTCOMES];

    void reset() {
        used_mem = 0;
        max_depth_ever_seen = 0;
        max_size_ever_seen = 0;
        for (int i = 0; i < JQRSTATS_NUM_OUTCOMES; i++) query_count[i] = 0;
    }
} JqrStats;
static JqrStats jqrstats;

// histograms
#define NUM_BUCKETS (11)
static size_t buckets[] = {
        0, 256, 1024, 4*1024, 16*1024, 64*1024, 256*1024, 1024*1024,
        4*1024*1024, 16*1024*1024, 64*1024*1024, SIZE_MAX
};

// histogram showing input document size distribution
static std::atomic_size_t doc_hist[NUM_BUCKETS];
// histogram showing serialized output size distribution
static std::atomic_size_t output_hist[NUM_BUCKETS];

void jqrstats_init() {
    // used_mem is left alone, otherwise values that are still alive would corrupt the accounting
    unsigned long long used_mem = jqrstats.used_mem;
    jqrstats.reset();
    jqrstats.used_mem = used_mem;
    for (size_t i = 0; i < NUM_BUCKETS; i++) {
        doc_hist[i] = 0;
        output_hist[i] = 0;
    }
}

int64_t jqrstats_begin_track_mem() {
    return thread_local_mem_counter;
}

int64_t jqrstats_end_track_mem(const int64_t begin_val) {
    return thread_local_mem_counter - begin_val;
}

void jqrstats_increment_used_mem(size_t delta) {
    // update the atomic global counter
    jqrstats.used_mem += delta;

    // update the thread local counter
    thread_local_mem_counter += delta;
}

void jqrstats_decrement_used_mem(size_t delta) {
    // update the atomic global counter
    jqrstats.used_mem -= delta;

    // update the thread local counter
    thread_local_mem_counter -= delta;
}

unsigned long long jqrstats_get_used_mem() {
    return jqrstats.used_mem;
}

unsigned long long jqrstats_get_max_depth_ever_seen() {
    return jqrstats.max_depth_ever_seen;
}

void jqrstats_update_max_depth_ever_seen(const size_t max_depth) {
    unsigned long long curr = jqrstats.max_depth_ever_seen;
    while (max_depth > curr && !jqrstats.max_depth_ever_seen.compare_exchange_weak(curr, max_depth)) {}
}

unsigned long long jqrstats_get_max_size_ever_seen() {
    return jqrstats.max_size_ever_seen;
}

void jqrstats_update_max_size_ever_seen(const size_t max_size) {
    unsigned long long curr = jqrstats.max_size_ever_seen;
    while (max_size > curr && !jqrstats.max_size_ever_seen.compare_exchange_weak(curr, max_size)) {}
}

unsigned long long jqrstats_get_query_count(JqrQueryOutcome outcome) {
    if (outcome < 0 || outcome >= JQRSTATS_NUM_OUTCOMES) return 0;
    return jqrstats.query_count[outcome];
}

/* Given a size (bytes), find histogram bucket index using binary search.
 */
uint32_t jqrstats_find_bucket(size_t size) {
    int lo = 0;
    int hi = NUM_BUCKETS;  // length of buckets[] is NUM_BUCKETS + 1
    while (hi - lo > 1) {
        uint32_t mid = (lo + hi) / 2;
        if (size < buckets[mid])
            hi = mid;
        else if (size > buckets[mid])
            lo = mid;
        else
            return mid;
    }
    return lo;
}

STATIC void copy_to_buf(const std::string &str, char *buf, const size_t buf_size) {
    if (buf_size == 0) return;
    size_t len = str.length() < buf_size ? str.length() : buf_size - 1;
    memcpy(buf, str.c_str(), len);
    buf[len] = '\0';
}

void jqrstats_sprint_hist_buckets(char *buf, const size_t buf_size) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i=0; i < NUM_BUCKETS; i++) {
        if (i > 0) oss << ",";
        oss << buckets[i];
    }
    oss << ",INF]";
    copy_to_buf(oss.str(), buf, buf_size);
}

STATIC void sprint_hist(std::atomic_size_t *arr, const size_t len, char *buf, const size_t buf_size) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i=0; i < len; i++) {
        if (i > 0) oss << ",";
        oss << arr[i].load();
    }
    oss << "]";
    copy_to_buf(oss.str(), buf, buf_size);
}

void jqrstats_sprint_doc_hist(char *buf, const size_t buf_size) {
    sprint_hist(doc_hist, NUM_BUCKETS, buf, buf_size);
}

void jqrstats_sprint_output_hist(char *buf, const size_t buf_size) {
    sprint_hist(output_hist, NUM_BUCKETS, buf, buf_size);
}

void jqrstats_update_stats_on_parse(const size_t doc_size, const size_t depth) {
    uint32_t bucket = jqrstats_find_bucket(doc_size);
    doc_hist[bucket]++;
    jqrstats_update_max_size_ever_seen(doc_size);
    jqrstats_update_max_depth_ever_seen(depth);
}

void jqrstats_update_stats_on_query(JqrQueryOutcome outcome) {
    if (outcome < 0 || outcome >= JQRSTATS_NUM_OUTCOMES) return;
    jqrstats.query_count[outcome]++;
}

void jqrstats_update_stats_on_output(const size_t output_size) {
    uint32_t bucket = jqrstats_find_bucket(output_size);
    output_hist[bucket]++;
}

void jqrstats_log_summary() {
    if (!jqrutil_is_log_level_enabled(JQR_LOG_DEBUG)) return;
    char buf[512];
    jqr_log(JQR_LOG_DEBUG, "used memory: %llu bytes", jqrstats_get_used_mem());
    jqr_log(JQR_LOG_DEBUG, "max document size: %llu bytes, max document depth: %llu",
            jqrstats_get_max_size_ever_seen(), jqrstats_get_max_depth_ever_seen());
    jqr_log(JQR_LOG_DEBUG, "queries: invalid=%llu empty=%llu singular=%llu plural=%llu",
            jqrstats_get_query_count(JQRSTATS_INVALID), jqrstats_get_query_count(JQRSTATS_EMPTY),
            jqrstats_get_query_count(JQRSTATS_SINGULAR), jqrstats_get_query_count(JQRSTATS_PLURAL));
    jqrstats_sprint_hist_buckets(buf, sizeof(buf));
    jqr_log(JQR_LOG_DEBUG, "histogram buckets: %s", buf);
    jqrstats_sprint_doc_hist(buf, sizeof(buf));
    jqr_log(JQR_LOG_DEBUG, "document size histogram: %s", buf);
    jqrstats_sprint_output_hist(buf, sizeof(buf));
    jqr_log(JQR_LOG_DEBUG, "output size histogram: %s", buf);
}

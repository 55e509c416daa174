/**
 * This C module is the JSON memory allocator (also called DOM allocator). All memory allocations made on behalf
 * of JSON values, permanent or transient, go through this interface, so that we can achieve the following:
 * 1. To track total memory allocated to JSON values. This is done through an atomic global counter in the stats
 *    module.
 * 2. To track the footprint of a single parse or query. This is done through a thread local counter, see
 *    jqrstats_begin_track_mem() and jqrstats_end_track_mem().
 *
 * The low level allocation functions are hooks. By default they call malloc, free, realloc and malloc_usable_size.
 * Unit tests replace them with tracking versions to detect leaks.
 */
#ifndef JQR_ALLOC_H_
#define JQR_ALLOC_H_

#include <stddef.h>

//
// All functions in jqr should use these (or the dom_xxx wrappers) to allocate JSON memory.
//
extern void *(*memory_alloc)(size_t size);
extern void (*memory_free)(void *ptr);
extern void *(*memory_realloc)(void *orig_ptr, size_t new_size);
extern size_t (*memory_allocsize)(void *ptr);


void *dom_alloc(size_t size);
void dom_free(void *ptr);
void *dom_realloc(void *orig_ptr, size_t new_size);

#endif  // JQR_ALLOC_H_

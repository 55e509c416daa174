#include "jqr/alloc.h"
#include "jqr/stats.h"
#include <malloc.h>
#include <stdlib.h>

#define STATIC /* decorator for static functions, remove so that backtrace symbols include these */

void *(*memory_alloc)(size_t size) = malloc;
void (*memory_free)(void *ptr) = free;
void *(*memory_realloc)(void *orig_ptr, size_t new_size) = realloc;
size_t (*memory_allocsize)(void *ptr) = malloc_usable_size;

/* Charge the change of a block's usable size, which may differ from the requested size. */
STATIC void account_resize(const size_t old_size, const size_t new_size) {
    if (new_size > old_size)
        jqrstats_increment_used_mem(new_size - old_size);
    else if (new_size < old_size)
        jqrstats_decrement_used_mem(old_size - new_size);
}

void *dom_alloc(size_t size) {
    void *ptr = memory_alloc(size);
    if (ptr != nullptr) account_resize(0, memory_allocsize(ptr));
    return ptr;
}

void dom_free(void *ptr) {
    if (ptr == nullptr) return;
    size_t size = memory_allocsize(ptr);
    memory_free(ptr);
    account_resize(size, 0);
}

void *dom_realloc(void *orig_ptr, size_t new_size) {
    if (orig_ptr == nullptr) return dom_alloc(new_size);
    if (new_size == 0) {
        dom_free(orig_ptr);
        return nullptr;
    }

    size_t orig_size = memory_allocsize(orig_ptr);
    void *new_ptr = memory_realloc(orig_ptr, new_size);
    if (new_ptr == nullptr) return nullptr;
    account_resize(orig_size, memory_allocsize(new_ptr));
    return new_ptr;
}

/*
 * Everything needed to declare keys, bind them and propagate them to other execution units.
 */

#ifndef DYNSCOPE_H
#define DYNSCOPE_H

#include <dynscope/dynscope_base.h>

#include <dynscope/util/errors.h>
#include <dynscope/util/lifecycle.h>
#include <dynscope/util/scope.h>

#include <dynscope/types/scalar_type.h>
#include <dynscope/types/type_meta.h>
#include <dynscope/types/value.h>

#include <dynscope/scope/binding_frame.h>
#include <dynscope/scope/carrier.h>
#include <dynscope/scope/continuation.h>
#include <dynscope/scope/resolution.h>
#include <dynscope/scope/scope_runner.h>
#include <dynscope/scope/scoped_key.h>
#include <dynscope/scope/snapshot.h>
#include <dynscope/scope/unit_state.h>

#include <dynscope/runtime/cancellation.h>
#include <dynscope/runtime/inherit.h>
#include <dynscope/runtime/scope_config.h>
#include <dynscope/runtime/scope_observer.h>
#include <dynscope/runtime/task_pool.h>
#include <dynscope/runtime/observers/scope_statistics.h>
#include <dynscope/runtime/observers/scope_trace.h>

#endif // DYNSCOPE_H

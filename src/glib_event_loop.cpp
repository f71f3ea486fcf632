#include "glib_event_loop.h"
#include "log.h"

GlibEventLoop::GlibEventLoop(GMainContext* context)
    : context_(context ? g_main_context_ref(context) : g_main_context_ref(g_main_context_default()))
    , loop_(g_main_loop_new(context_, FALSE)) {
}

GlibEventLoop::~GlibEventLoop() {
    std::map<TimerId, GSource*> timers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        timers.swap(timers_);
    }
    for (auto& pair : timers) {
        g_source_destroy(pair.second);
        g_source_unref(pair.second);
    }
    g_main_loop_unref(loop_);
    g_main_context_unref(context_);
}

void GlibEventLoop::run() {
    LOG("LOOP", "Main loop running");
    g_main_loop_run(loop_);
    LOG("LOOP", "Main loop stopped");
}

void GlibEventLoop::quit() {
    g_main_loop_quit(loop_);
}

void GlibEventLoop::post(std::function<void()> task) {
    // An idle source rather than g_main_context_invoke: the task must never
    // run inside the caller's stack, even on the loop thread
    GSource* source = g_idle_source_new();
    g_source_set_priority(source, G_PRIORITY_DEFAULT);
    g_source_set_callback(source, dispatchPosted, new std::function<void()>(std::move(task)), destroyPosted);
    g_source_attach(source, context_);
    g_source_unref(source);
}

gboolean GlibEventLoop::dispatchPosted(gpointer data) {
    auto* task = static_cast<std::function<void()>*>(data);
    if (*task) {
        (*task)();
    }
    return G_SOURCE_REMOVE;
}

void GlibEventLoop::destroyPosted(gpointer data) {
    delete static_cast<std::function<void()>*>(data);
}

EventLoop::TimerId GlibEventLoop::scheduleRepeating(std::chrono::milliseconds interval,
                                                    std::function<void()> task) {
    return schedule(interval, true, std::move(task));
}

EventLoop::TimerId GlibEventLoop::scheduleOnce(std::chrono::milliseconds delay,
                                               std::function<void()> task) {
    return schedule(delay, false, std::move(task));
}

EventLoop::TimerId GlibEventLoop::schedule(std::chrono::milliseconds interval, bool repeating,
                                           std::function<void()> task) {
    guint ms = interval.count() > 0 ? static_cast<guint>(interval.count()) : 0;
    GSource* source = g_timeout_source_new(ms);

    Task* state = new Task{this, kInvalidTimer, repeating, std::move(task)};
    g_source_set_callback(source, dispatchTimer, state, destroyTimer);

    std::lock_guard<std::mutex> lock(mutex_);
    // Attach under the lock so a timer firing on another thread finds its id
    TimerId id = g_source_attach(source, context_);
    state->id = id;
    timers_[id] = source;   // keeps the reference from g_timeout_source_new
    return id;
}

gboolean GlibEventLoop::dispatchTimer(gpointer data) {
    Task* task = static_cast<Task*>(data);
    {
        std::lock_guard<std::mutex> lock(task->loop->mutex_);
        if (task->loop->timers_.find(task->id) == task->loop->timers_.end()) {
            return G_SOURCE_REMOVE;
        }
    }

    bool repeating = task->repeating;
    GlibEventLoop* loop = task->loop;
    TimerId id = task->id;
    if (!repeating) {
        loop->forget(id);
    }
    if (task->fn) {
        task->fn();
    }
    return repeating ? G_SOURCE_CONTINUE : G_SOURCE_REMOVE;
}

void GlibEventLoop::destroyTimer(gpointer data) {
    delete static_cast<Task*>(data);
}

void GlibEventLoop::forget(TimerId id) {
    GSource* source = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = timers_.find(id);
        if (it == timers_.end()) {
            return;
        }
        source = it->second;
        timers_.erase(it);
    }
    g_source_unref(source);
}

void GlibEventLoop::cancel(TimerId id) {
    if (id == kInvalidTimer) {
        return;
    }
    GSource* source = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = timers_.find(id);
        if (it == timers_.end()) {
            return;
        }
        source = it->second;
        timers_.erase(it);
    }
    // Safe from inside the timer's own callback: GLib defers the destroy
    // notify until dispatch returns
    g_source_destroy(source);
    g_source_unref(source);
}

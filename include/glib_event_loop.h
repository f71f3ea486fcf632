#ifndef GLIB_EVENT_LOOP_H
#define GLIB_EVENT_LOOP_H

#include "event_loop.h"

#include <glib.h>
#include <functional>
#include <map>
#include <mutex>

// EventLoop on a GLib main context. GStreamer bus watches and webrtcbin
// promises are marshalled onto the same context, so every session callback
// runs on the thread that calls run().
class GlibEventLoop : public EventLoop {
public:
    // nullptr uses the global default context
    explicit GlibEventLoop(GMainContext* context = nullptr);
    ~GlibEventLoop() override;

    GlibEventLoop(const GlibEventLoop&) = delete;
    GlibEventLoop& operator=(const GlibEventLoop&) = delete;

    void run();
    void quit();

    void post(std::function<void()> task) override;
    TimerId scheduleRepeating(std::chrono::milliseconds interval, std::function<void()> task) override;
    TimerId scheduleOnce(std::chrono::milliseconds delay, std::function<void()> task) override;
    void cancel(TimerId id) override;

private:
    struct Task {
        GlibEventLoop* loop;
        TimerId id;
        bool repeating;
        std::function<void()> fn;
    };

    TimerId schedule(std::chrono::milliseconds interval, bool repeating, std::function<void()> task);
    void forget(TimerId id);

    static gboolean dispatchPosted(gpointer data);
    static void destroyPosted(gpointer data);
    static gboolean dispatchTimer(gpointer data);
    static void destroyTimer(gpointer data);

    GMainContext* context_;
    GMainLoop* loop_;
    std::mutex mutex_;
    std::map<TimerId, GSource*> timers_;
};

#endif // GLIB_EVENT_LOOP_H

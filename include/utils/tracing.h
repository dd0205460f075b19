#pragma once

#include <cstdint>
#include <string>

#ifdef QUARRY_ENABLE_TRACING
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/tracer.h>
#include <opentelemetry/context/context.h>
namespace otel = opentelemetry;
#endif

namespace quarry {

/**
 * Span factory backed by OpenTelemetry when QUARRY_ENABLE_TRACING is defined.
 * Without it every span is an inert value and all calls are no-ops.
 *
 *   auto span = Tracer::startSpan("QueryExecutor.execute");
 *   span.setAttribute("query.kind", "Person");
 */
class Tracer {
public:
    /// Installs an OTLP HTTP exporter. Returns false when the collector is
    /// unreachable or the tracer was already set up.
    static bool initialize(const std::string& serviceName, const std::string& endpoint);
    static void shutdown();
    static bool isEnabled();

    class Span {
    public:
        Span() = default;
        ~Span();

        Span(Span&& other) noexcept;
        Span& operator=(Span&& other) noexcept;
        Span(const Span&) = delete;
        Span& operator=(const Span&) = delete;

        void setAttribute(const std::string& key, const std::string& value);
        void setAttribute(const std::string& key, const char* value);
        void setAttribute(const std::string& key, int64_t value);
        void setAttribute(const std::string& key, double value);
        void setAttribute(const std::string& key, bool value);

        void recordError(const std::string& errorMessage);
        void setStatus(bool ok, const std::string& description = "");
        void end();

        bool isValid() const { return valid_; }

    private:
        friend class Tracer;

#ifdef QUARRY_ENABLE_TRACING
        explicit Span(otel::nostd::shared_ptr<otel::trace::Span> span);
        otel::nostd::shared_ptr<otel::trace::Span> span_;
        otel::context::Context context_;
#endif
        bool valid_ = false;
        bool ended_ = false;
    };

    static Span startSpan(const std::string& name);
    static Span startChildSpan(const std::string& name, const Span& parent);

private:
#ifdef QUARRY_ENABLE_TRACING
    static otel::nostd::shared_ptr<otel::trace::Tracer> tracer_;
#endif
    static bool initialized_;
};

// Span bound to a lexical scope
class ScopedSpan {
public:
    explicit ScopedSpan(const std::string& name) : span_(Tracer::startSpan(name)) {}

    template<typename T>
    void setAttribute(const std::string& key, T&& value) {
        span_.setAttribute(key, std::forward<T>(value));
    }

    void recordError(const std::string& errorMessage) { span_.recordError(errorMessage); }
    void setStatus(bool ok, const std::string& description = "") { span_.setStatus(ok, description); }

    Tracer::Span& span() { return span_; }

private:
    Tracer::Span span_;
};

} // namespace quarry

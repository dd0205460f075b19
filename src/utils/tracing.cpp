#include "utils/tracing.h"
#include "utils/logger.h"

#include <string>
#include <utility>

#ifdef QUARRY_ENABLE_TRACING
#include <regex>
#include <boost/asio.hpp>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/trace/simple_processor_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/sdk/resource/resource.h>

namespace otel_sdk = opentelemetry::sdk;
namespace otel_exporter = opentelemetry::exporter::otlp;
#endif

namespace quarry {

#ifdef QUARRY_ENABLE_TRACING
otel::nostd::shared_ptr<otel::trace::Tracer> Tracer::tracer_;

namespace {

constexpr uint16_t kDefaultOtlpPort = 4318;

bool collectorReachable(const std::string& endpoint) {
    std::regex re(R"((?:http|https)://([^/:]+)(?::(\d+))?)", std::regex::icase);
    std::smatch m;
    std::string host = endpoint;
    uint16_t port = kDefaultOtlpPort;
    if (std::regex_search(endpoint, m, re)) {
        host = m[1].str();
        if (m[2].matched) {
            port = static_cast<uint16_t>(std::stoi(m[2].str()));
        }
    }

    namespace net = boost::asio;
    using tcp = net::ip::tcp;
    net::io_context io;
    tcp::resolver resolver(io);
    boost::system::error_code ec;
    auto results = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        QUARRY_WARN("Tracing collector resolve failed ({}:{}): {}", host, port, ec.message());
        return false;
    }
    tcp::socket socket(io);
    socket.connect(*results.begin(), ec);
    if (ec) {
        QUARRY_WARN("Tracing collector unreachable ({}:{}): {}", host, port, ec.message());
        return false;
    }
    return true;
}

} // namespace
#endif

bool Tracer::initialized_ = false;

bool Tracer::initialize(const std::string& serviceName, const std::string& endpoint) {
#ifdef QUARRY_ENABLE_TRACING
    if (initialized_) {
        QUARRY_WARN("Tracer already initialized");
        return false;
    }
    try {
        if (!collectorReachable(endpoint)) {
            return false;
        }

        otel_exporter::OtlpHttpExporterOptions opts;
        opts.url = endpoint + "/v1/traces";
        auto processor = otel_sdk::trace::SimpleSpanProcessorFactory::Create(
            otel_exporter::OtlpHttpExporterFactory::Create(opts));
        auto resource = otel_sdk::resource::Resource::Create(
            otel_sdk::resource::ResourceAttributes{{"service.name", serviceName}});
        std::shared_ptr<otel_sdk::trace::TracerProvider> provider =
            otel_sdk::trace::TracerProviderFactory::Create(std::move(processor), resource);
        otel::trace::Provider::SetTracerProvider(
            otel::nostd::shared_ptr<otel::trace::TracerProvider>(provider));
        tracer_ = provider->GetTracer(serviceName);

        initialized_ = true;
        QUARRY_INFO("Tracing enabled: service={}, endpoint={}", serviceName, endpoint);
        return true;
    } catch (const std::exception& e) {
        QUARRY_ERROR("Failed to initialize tracing: {}", e.what());
        return false;
    }
#else
    QUARRY_DEBUG("Tracing not compiled in; ignoring service={} endpoint={}", serviceName, endpoint);
    return false;
#endif
}

void Tracer::shutdown() {
#ifdef QUARRY_ENABLE_TRACING
    if (!initialized_) {
        return;
    }
    auto provider = otel::trace::Provider::GetTracerProvider();
    if (auto* sdk_provider = dynamic_cast<otel_sdk::trace::TracerProvider*>(provider.get())) {
        sdk_provider->Shutdown();
    }
    tracer_ = nullptr;
    initialized_ = false;
#endif
}

bool Tracer::isEnabled() {
    return initialized_;
}

Tracer::Span Tracer::startSpan(const std::string& name) {
#ifdef QUARRY_ENABLE_TRACING
    if (!initialized_ || tracer_ == nullptr) {
        return Span();
    }
    return Span(tracer_->StartSpan(name));
#else
    (void)name;
    return Span();
#endif
}

Tracer::Span Tracer::startChildSpan(const std::string& name, const Span& parent) {
#ifdef QUARRY_ENABLE_TRACING
    if (!initialized_ || tracer_ == nullptr || !parent.valid_) {
        return Span();
    }
    otel::trace::StartSpanOptions options;
    options.parent = parent.context_;
    return Span(tracer_->StartSpan(name, options));
#else
    (void)name;
    (void)parent;
    return Span();
#endif
}

#ifdef QUARRY_ENABLE_TRACING
Tracer::Span::Span(otel::nostd::shared_ptr<otel::trace::Span> span)
    : span_(span), valid_(span != nullptr) {
    if (span_) {
        context_ = otel::context::RuntimeContext::GetCurrent().SetValue(otel::trace::kSpanKey, span_);
    }
}
#endif

Tracer::Span::~Span() {
    if (valid_ && !ended_) {
        end();
    }
}

Tracer::Span::Span(Span&& other) noexcept : valid_(other.valid_), ended_(other.ended_) {
#ifdef QUARRY_ENABLE_TRACING
    span_ = std::move(other.span_);
    context_ = std::move(other.context_);
#endif
    other.valid_ = false;
}

Tracer::Span& Tracer::Span::operator=(Span&& other) noexcept {
    if (this != &other) {
        if (valid_ && !ended_) {
            end();
        }
        valid_ = other.valid_;
        ended_ = other.ended_;
#ifdef QUARRY_ENABLE_TRACING
        span_ = std::move(other.span_);
        context_ = std::move(other.context_);
#endif
        other.valid_ = false;
    }
    return *this;
}

#ifdef QUARRY_ENABLE_TRACING
#define QUARRY_SPAN_SET(key, value) \
    do { if (span_) { span_->SetAttribute(key, value); } } while (0)
#else
#define QUARRY_SPAN_SET(key, value) \
    do { (void)(key); (void)(value); } while (0)
#endif

void Tracer::Span::setAttribute(const std::string& key, const std::string& value) {
    QUARRY_SPAN_SET(key, value);
}

void Tracer::Span::setAttribute(const std::string& key, const char* value) {
    setAttribute(key, std::string(value ? value : ""));
}

void Tracer::Span::setAttribute(const std::string& key, int64_t value) {
    QUARRY_SPAN_SET(key, value);
}

void Tracer::Span::setAttribute(const std::string& key, double value) {
    QUARRY_SPAN_SET(key, value);
}

void Tracer::Span::setAttribute(const std::string& key, bool value) {
    QUARRY_SPAN_SET(key, value);
}

#undef QUARRY_SPAN_SET

void Tracer::Span::recordError(const std::string& errorMessage) {
#ifdef QUARRY_ENABLE_TRACING
    if (span_) {
        span_->AddEvent("exception", {{"exception.message", errorMessage}});
        span_->SetStatus(otel::trace::StatusCode::kError, errorMessage);
    }
#else
    (void)errorMessage;
#endif
}

void Tracer::Span::setStatus(bool ok, const std::string& description) {
#ifdef QUARRY_ENABLE_TRACING
    if (span_) {
        span_->SetStatus(ok ? otel::trace::StatusCode::kOk : otel::trace::StatusCode::kError, description);
    }
#else
    (void)ok;
    (void)description;
#endif
}

void Tracer::Span::end() {
#ifdef QUARRY_ENABLE_TRACING
    if (span_ && !ended_) {
        span_->End();
    }
#endif
    ended_ = true;
}

} // namespace quarry

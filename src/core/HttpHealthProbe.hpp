#ifndef HTTPHEALTHPROBE_HPP
#define HTTPHEALTHPROBE_HPP

#include <memory>

#include "../interfaces/IHealthProbe.hpp"
#include "../interfaces/ITransport.hpp"

// GET <address><path>; healthy only on HTTP 200.
class HttpHealthProbe : public IHealthProbe {
public:
    explicit HttpHealthProbe(std::shared_ptr<ITransport> transport);

    void probe(const BackendUrlInfo& endpoint,
               const std::string& path,
               std::chrono::milliseconds timeout,
               Callback callback) override;

private:
    std::shared_ptr<ITransport> transport_;
};

#endif // HTTPHEALTHPROBE_HPP

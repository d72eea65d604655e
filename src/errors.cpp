// filename: src/errors.cpp
#include <core/errors.hpp>
#include <string>

namespace {

class MqCategory : public boost::system::error_category {
public:
    const char* name() const noexcept override { return "jobq"; }

    std::string message(int ev) const override {
        switch (static_cast<mq_errc>(ev)) {
            case mq_errc::empty_job:
                return "invalid empty job";
            case mq_errc::already_closed:
                return "queue iterator already closed";
            case mq_errc::cannot_acknowledge:
                return "can't acknowledge this message, it does not come from a queue "
                       "or was already acknowledged";
            case mq_errc::transactions_not_supported:
                return "transactions not supported";
            case mq_errc::unsupported_scheme:
                return "unsupported broker URI scheme";
            case mq_errc::invalid_uri:
                return "invalid broker URI";
            case mq_errc::invalid_option:
                return "invalid broker option";
            case mq_errc::connection_lost:
                return "connection to broker lost";
            case mq_errc::reconnect_failed:
                return "could not reconnect to broker";
            case mq_errc::end_of_stream:
                return "end of stream";
            case mq_errc::unknown_content_type:
                return "unknown content type";
            case mq_errc::payload_mismatch:
                return "payload does not match the requested type";
            case mq_errc::malformed_frame:
                return "malformed frame";
        }
        return "unknown jobq error";
    }
};

} // namespace

const boost::system::error_category& mq_category() {
    static const MqCategory category;
    return category;
}

boost::system::error_code make_error_code(mq_errc e) {
    return boost::system::error_code(static_cast<int>(e), mq_category());
}

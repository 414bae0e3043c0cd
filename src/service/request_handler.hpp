#ifndef PIIANON_SERVICE_REQUEST_HANDLER_HPP
#define PIIANON_SERVICE_REQUEST_HANDLER_HPP

#include <string>
#include <exception>
#include "anonymizer_service.hpp"
#include "request.hpp"
#include "response.hpp"
#include "../anonymize/structure_walker.hpp"
#include "../core/errors.hpp"
#include "../util/logger.hpp"

/**
 * @file request_handler.hpp
 * @brief Runs one request document against the service and maps failures to status codes.
 *
 *   200  success
 *   400  malformed request, unknown operator, bad operator parameters, missing key,
 *        unsupported entity type, unsupported value, nesting too deep
 *   413  document larger than max_request_bytes
 *   500  detection engine fault or any other unexpected error
 *
 * This is the only place where errors are turned into responses.
 */

namespace piianon {
namespace service {

inline Response execute(const AnonymizerService &service, const Request &req)
{
    switch (req.mode) {
    case RequestMode::Anonymize: {
        StructureResult r = service.anonymizeStructure(req.payload, req.recognizerConfig, req.operatorSpec,
                                                       req.strategy);
        return Response(200, "OK", renderStructureResult(r, anonymize::computePayloadStats(req.payload)));
    }
    case RequestMode::AnonymizeText:
        return Response(200, "OK",
                        renderTextResult(service.anonymizeText(req.text, req.recognizerConfig, req.operatorSpec)));
    case RequestMode::Analyze:
        return Response(200, "OK", renderAnalysisResult(service.analyze(req.text, req.recognizerConfig)));
    case RequestMode::Annotate:
        return Response(200, "OK", renderAnnotationResult(service.annotate(req.text, req.recognizerConfig)));
    case RequestMode::Entities:
        return Response(200, "OK", renderEntities(service.listSupportedEntities()));
    }
    return Response(400, "unknown mode");
}

/**
 * @brief Parse and execute @p document. Never throws for request-level failures.
 */
inline Response handleRequest(const AnonymizerService &service, const std::string &document)
{
    const std::size_t limit = service.settings().maxRequestBytes;
    if (document.size() > limit) {
        util::logger::warn("handleRequest: rejected " + std::to_string(document.size()) +
                           " byte document, limit is " + std::to_string(limit));
        return Response(413, "request exceeds " + std::to_string(limit) + " bytes");
    }

    try {
        Request req = parseRequest(document, service.defaultRecognizerConfig());
        return execute(service, req);
    }
    catch (const core::DetectionEngineError &ex) {
        util::logger::error(std::string("handleRequest: detection engine failure: ") + ex.what());
        return Response(500, ex.what());
    }
    catch (const core::AnonymizerError &ex) {
        util::logger::warn(std::string("handleRequest: rejected request: ") + ex.what());
        return Response(400, ex.what());
    }
    catch (const std::exception &ex) {
        util::logger::error(std::string("handleRequest: internal error: ") + ex.what());
        return Response(500, "internal error");
    }
}

} // namespace service
} // namespace piianon

#endif // PIIANON_SERVICE_REQUEST_HANDLER_HPP

/*
 * Identify Handler - "POST identify {image}" without the HTTP server
 *
 * RESPONSES:
 *   200 {"results":[{"photo_id","similarity","path","date"}...]}
 *   200 {"results":[],"message":"no face detected"}
 *   400 {"error":...}   missing / undecodable image
 *   503 {"error":"face identification temporarily unavailable"}
 *   500 {"error":...}   store or data-integrity failure
 *
 * One entry per matching descriptor; a photo with several matching faces
 * appears once per face.
 */

#pragma once
#include "database/photo_catalog.hpp"
#include "search/similarity_search.hpp"
#include <string>

struct ApiResponse {
    int status = 200;
    std::string body;
};

class IdentifyHandler {
public:
    IdentifyHandler(const SimilaritySearch& search, const PhotoCatalog& catalog,
                    float threshold = DEFAULT_MATCH_THRESHOLD,
                    size_t top_k = DEFAULT_TOP_K);

    // image_b64: plain base64 or a data: URL
    ApiResponse handle(const std::string& image_b64) const;
    ApiResponse handle(const std::string& image_b64, float threshold, size_t top_k) const;

private:
    const SimilaritySearch& search;
    const PhotoCatalog& catalog;
    float threshold;
    size_t top_k;

    std::string render(const IdentifyResult& result) const;
};

ApiResponse error_response(int status, const std::string& message);

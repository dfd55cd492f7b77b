#pragma once

#include <cstdint>
#include <string>

#include "ChunkPlanner.hpp"
#include "TreeHash.hpp"

struct UploadSession {
	std::string name;
	uint64_t size = 0;

	std::string upload_id;
	ChunkPlan plan;
	TreeHash::Tree tree;

	uint64_t offset = 0;
	uint64_t parts_completed = 0;
};

struct BatchProgress {
	uint64_t bytes_done = 0;
	uint64_t bytes_total = 0;
};

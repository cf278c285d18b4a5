#ifndef _RTZIP_H
#define _RTZIP_H

#include "config.h"
#include "meta.h"

#include <vector>

namespace rtv
{

/**
 * Minimal reader of ZIP archives held in memory, locating members through the central
 * directory. Supports stored and deflated members.
 */
class RTV_API tZipReader
{
public:
	struct tEntry
	{
		mstring name;
		uint16_t method = 0;
		uint32_t crc = 0;
		size_t compressedSize = 0, size = 0;
		size_t localHeaderOffset = 0;
	};

	tZipReader(const uint8_t *data, size_t len);

	//! Parses the central directory. @throw tRetrievalException if the data is not a ZIP archive
	void Open();
	const std::vector<tEntry>& GetEntries() const { return m_entries; }
	//! nullptr if there is no such member
	const tEntry* Find(string_view name) const;
	/**
	 * Uncompressed contents of a member, verified with its checksum.
	 * @throw tRetrievalException on damaged data or unsupported compression
	 */
	tBytes Extract(const tEntry& entry) const;

private:
	const uint8_t *m_data;
	size_t m_len;
	std::vector<tEntry> m_entries;
};

}

#endif

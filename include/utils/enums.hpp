#pragma once

// Canonical names are the enumerator spellings (see CipherFactory::kindName).
enum class CipherKind {
	CAESAR_CIPHER,
	NULL_CIPHER,
	PLAYFAIR_CIPHER,
	PSEUDO_ONE_TIME_PAD,
	VIGNERE_CIPHER
};

enum class OptionTarget {
	CIPHER_KEY,
	CIPHER_NAME,
	CIPHER_ENABLE
};

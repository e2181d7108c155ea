#ifndef COMMANDPARAMS_H
#define COMMANDPARAMS_H

#include <QString>

// Form state of the Download tab. Values are taken as typed; builders and
// validators trim them.
struct DownloadParams {
    QString executable;                 // empty = "sbstck-dl" from PATH
    QString url;
    QString outputDir;
    QString formatLabel = "Markdown (.md)";

    bool filterByDate = false;
    QString afterDate;                  // YYYY-MM-DD
    QString beforeDate;

    bool downloadImages = false;
    QString imageQuality = "low";       // low, medium, high
    QString imagesDir = "images";

    bool downloadFiles = false;
    QString fileExtensions;             // "pdf,docx" (blank = all)
    QString filesDir = "files";

    bool addSourceUrl = true;
    bool createArchive = false;
    QString rateLimit = "1";            // requests per second
    bool verbose = false;
    bool dryRun = false;

    QString cookieName = "substack.sid";
    QString cookieValue;                // never persisted
};

// Form state of the ePub Conversion tab.
struct ConvertParams {
    QString executable;                 // empty = "pandoc" from PATH
    QString sourceDir;
    QString outputFile;
    QString title;
    QString author;
    bool tableOfContents = true;
    QString splitLevel = "1";
};

#endif // COMMANDPARAMS_H

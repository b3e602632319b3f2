#ifndef ELEMENTINSPECTORFACTORY_H
#define ELEMENTINSPECTORFACTORY_H

class QObject;
class IElementInspector;

// Returns nullptr where no accessibility tree can be queried.
IElementInspector* createPlatformElementInspector(QObject *parent = nullptr);

#endif // ELEMENTINSPECTORFACTORY_H
